#include <iostream>
#include "dynobj.hpp"

// Example usage
using namespace dynobj;

struct Address
{
    Required<std::string, "street"> street;
    Field<std::string,    "city">   city;
};

struct Person
{
    Required<std::string,              "name">    name;
    Field<std::int32_t,                "age">     age;
    Field<Instance<Address>,           "address"> address;
    Field<std::vector<std::string>,    "emails">  emails;
    Meta<std::string,                  "source">  source;

    std::string greeting() const
    {
        return "Hello, " + name() + (age() ? std::format(" ({})", *age()) : std::string());
    }
};

void typedExamples()
{
    std::cout << "=== Typed access ===\n\n";

    auto const alice = Instance<Person>()
        .with("name"_fld, "Alice")
        .with("age"_fld, 31)
        .with("address"_fld, Instance<Address>().with("street"_fld, "Main St").with("city"_fld, "Springfield"))
        .withMeta("source"_fld, "demo");

    std::cout << alice->greeting() << std::endl;
    std::cout << "lives on " << (*alice->address())->street() << std::endl;
    std::cout << "source: " << alice->source().value_or("unknown") << std::endl;
    std::cout << alice << std::endl;

    auto const older = alice.with("age"_fld, 32);
    std::cout << "after a birthday: " << older->greeting() << ", unchanged: " << alice->greeting() << std::endl;

    std::cout << "\n--- fields of " << Instance<Person>::schema().name() << " ---\n";
    for (auto const* field : Instance<Person>::schema().fieldGetters())
        std::cout << "  " << field->name << " : " << field->type().name() << (field->isRequired() ? " (required)" : "") << "\n";
}

void dynamicExamples()
{
    std::cout << "\n=== Dynamic invocation ===\n\n";

    Object const bob = deserialize<Person>(R"({:name "Bob" :emails ["bob@example.com"] :nickname "Bobby"})");

    auto const nickname = bob.invoke("nickname");
    std::cout << "nickname (raw map access): " << std::get<Value>(nickname) << std::endl;

    auto const renamed = std::get<Object>(bob.invoke("name", Value("Robert")));
    std::cout << "renamed: " << std::get<std::string>(renamed.invoke("toString")) << std::endl;

    auto const emails = std::get<std::any>(bob.invoke("emails"));
    std::cout << "first email: " << std::any_cast<std::vector<std::string>>(emails).front() << std::endl;
}

void diffExamples()
{
    std::cout << "\n=== Merge and diff ===\n\n";

    auto const before = deserialize<Person>(R"({:name "Carol" :age 40 :emails ["c@example.com"]})");
    auto const after  = deserialize<Person>(R"({:name "Carol" :age 41})");

    std::cout << "merged:     " << before.merge(after) << std::endl;
    std::cout << "unchanged:  " << before.intersect(after) << std::endl;
    std::cout << "removed:    " << before.subtract(after) << std::endl;
    std::cout << "added:      " << after.subtract(before) << std::endl;
}

void validationExamples()
{
    std::cout << "\n=== Validation ===\n\n";

    auto const broken = deserialize<Person>(R"({:age "old" :address {:city "Nowhere"}})");

    try
    {
        broken.validate();
    }
    catch (ValidationFailed const& e)
    {
        std::cout << e.what() << std::endl;
    }
}

void tagExamples()
{
    std::cout << "\n=== Tagged literals ===\n\n";

    registerTag<Person>("demo/person");
    registerTag<Address>("demo/address");

    auto const dave = deserialize<Person>(R"(#demo/person{:name "Dave" :address #demo/address{:street "Elm St"}})");
    std::cout << serialize(dave) << std::endl;

    auto const wide = dave.with("emails"_fld, { "dave@example.com", "dave.d@example.org", "d@example.net" });
    wide.prettyPrint();
    std::cout << std::endl;

    deregisterTag<Person>();
    deregisterTag<Address>();
}

int main()
{
    try
    {
        typedExamples();
        dynamicExamples();
        diffExamples();
        validationExamples();
        tagExamples();
    }
    catch (std::exception const& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
