// ═══════════════════════════════════════════════════════════════════
//  bookstore.cpp — A small catalogue queried through miniql
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Building object types with resolvers and default lookup
//    • Host structs via MINIQL_SERIALIZE and a HostObject
//    • A custom scalar with its own serializer
//    • Mutations and the {"data", "errors"} response document
//
//  Usage:
//    ./bookstore '{ books { title author { name } } }'
//    echo 'mutation { restock }' | ./bookstore
//
//  MINIQL_DEBUG=1 adds throw sites to errors, MINIQL_LOG_LEVEL=debug
//  traces every resolved field.
//
// ═══════════════════════════════════════════════════════════════════

#include "miniql/miniql.h"
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace miniql;

struct Author {
    std::string name;
    int born;
    MINIQL_SERIALIZE(Author, name, born)
};

struct Book {
    std::string isbn;
    std::string title;
    int priceCents;
    int stock;
    Author author;
    MINIQL_SERIALIZE(Book, isbn, title, priceCents, stock, author)
};

static std::vector<Book> catalogue = {
    {"978-0441013593", "Dune", 1099, 4, {"Frank Herbert", 1920}},
    {"978-0553293357", "Foundation", 899, 0, {"Isaac Asimov", 1920}},
    {"978-0441569595", "Neuromancer", 1250, 2, {"William Gibson", 1948}},
};

// ── Store-wide figures computed on demand ──
class Inventory : public HostObject {
public:
    std::optional<Value> property(const std::string& name) const override {
        if (name == "titles") return Value(static_cast<int>(catalogue.size()));
        return std::nullopt;
    }

    std::optional<Value> invoke(const std::string& name) const override {
        if (name == "copies") {
            int copies = 0;
            for (const auto& book : catalogue) copies += book.stock;
            return Value(copies);
        }
        if (name == "soldOut") {
            Value::List titles;
            for (const auto& book : catalogue) {
                if (book.stock == 0) titles.emplace_back(book.title);
            }
            return Value(std::move(titles));
        }
        return std::nullopt;
    }

    Json toJson() const override {
        return Json{{"titles", catalogue.size()}};
    }
};

static std::shared_ptr<const Schema> buildSchema() {
    // Price: integer cents rendered as "12.50"
    auto price = Type::customScalar("Price", [](const Value& value) -> Json {
        auto cents = value.data() ? coercion::parseInt(*value.data()) : std::nullopt;
        if (!cents) {
            throw std::invalid_argument("expected integer cents");
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld.%02lld",
                      static_cast<long long>(*cents / 100), static_cast<long long>(*cents % 100));
        return std::string(buf);
    }, "Amount in the store currency.");

    auto author = Type::object("Author", "Someone who wrote a book.");
    author->addField("name", Type::nonNull(Type::scalar(ScalarKind::String)));
    author->addField("born", Type::scalar(ScalarKind::Int));

    auto book = Type::object("Book", "A title in the catalogue.");
    book->addField("isbn", Type::nonNull(Type::scalar(ScalarKind::ID)));
    book->addField("title", Type::nonNull(Type::scalar(ScalarKind::String)));
    book->addField("author", author);
    book->addField(FieldDefinition("price", price)
                       .describe("Shelf price.")
                       .resolve([](const Value& parent, const Json&) -> Value {
                           return parent.lookup("priceCents").value_or(Value());
                       }));
    book->addField(FieldDefinition("inStock", Type::scalar(ScalarKind::Boolean))
                       .resolve([](const Value& parent, const Json&) -> Value {
                           return parent.lookup("stock").value_or(Value());
                       }));

    auto inventory = Type::object("Inventory");
    inventory->addField("titles", Type::scalar(ScalarKind::Int));
    inventory->addField("copies", Type::scalar(ScalarKind::Int));
    inventory->addField("soldOut", Type::listOf(Type::nonNull(Type::scalar(ScalarKind::String))));

    auto query = Type::object("Query");
    query->addField("books", Type::listOf(Type::nonNull(book)), [](const Value&, const Json&) -> Value {
        return catalogue;
    });
    query->addField("featured", book, [](const Value&, const Json&) -> Value {
        return catalogue.front();
    });
    query->addField("inventory", inventory, [](const Value&, const Json&) -> Value {
        return std::make_shared<const Inventory>();
    });

    auto mutation = Type::object("Mutation");
    mutation->addField(FieldDefinition("restock", Type::nonNull(Type::scalar(ScalarKind::Int)))
                           .describe("Adds one copy of every sold-out title; returns how many.")
                           .resolve([](const Value&, const Json&) -> Value {
                               int restocked = 0;
                               for (auto& book : catalogue) {
                                   if (book.stock == 0) {
                                       book.stock = 1;
                                       restocked++;
                                   }
                               }
                               return restocked;
                           }));

    return std::make_shared<const Schema>(query, mutation);
}

int main(int argc, char* argv[]) {
    auto options = Options::fromEnv();
    Engine engine(buildSchema(), options);

    console::debug("Schema types:", Json(engine.schema().types()));

    std::vector<std::string> queries;
    for (int i = 1; i < argc; ++i) {
        queries.emplace_back(argv[i]);
    }
    if (queries.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty()) queries.push_back(line);
        }
    }
    if (queries.empty()) {
        queries.push_back("{ featured { title price author { name } } inventory { titles soldOut } }");
    }

    int failures = 0;
    for (const auto& query : queries) {
        auto response = engine.respond(query);
        if (response.contains("errors")) failures++;
        std::cout << response.dump(2) << std::endl;
    }
    return failures == 0 ? 0 : 1;
}
