#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers.hpp"
#include "catch2/matchers/catch_matchers_exception.hpp"
#include "catch2/matchers/catch_matchers_string.hpp"
#include "fieldwise/FieldwiseEquality.hpp"
#include "fieldwise/FieldwiseException.hpp"
#include "fieldwise/bind/adapter/StrategyAdapter.hpp"
#include "fieldwise/bind/builder/TypeDefineBuilder.hpp"

#include <boost/hana/define_struct.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>


namespace strategy_test {

enum class Color { Red, Green };

struct WithOperator {
    int  v{0};
    bool operator==(WithOperator const&) const = default;
};

struct WithEquals {
    int  v{0};
    bool equals(WithEquals const& other) const { return v == other.v; }
};

struct BaseWithEquals {
    int  v{0};
    bool equals(BaseWithEquals const& other) const { return v == other.v; }
};

// inherits equals(BaseWithEquals const&), the parameter does not match
struct LooseEquals : BaseWithEquals {};

struct Opaque {
    int a{0};
    int b{0};
};

struct Node {
    int id{0};
};

struct Counted {
    int               v{0};
    static inline int comparisons = 0;

    bool operator==(Counted const& other) const {
        ++comparisons;
        return v == other.v;
    }
};

struct Explosive {
    bool operator==(Explosive const&) const { throw std::runtime_error("delegated equality failed"); }
};

// scratch is left out of the registered layout
struct Point {
    int x{0};
    int y{0};
    int scratch{0};

    static fieldwise::meta::TypeDefine const& define() {
        static fieldwise::meta::TypeDefine const def =
            fieldwise::bind::defineType<Point>("Point").field("x", &Point::x).field("y", &Point::y).build();
        return def;
    }
};

// no equality, and floating point has no unique representation
struct Unlaid {
    double weight{0};
};

struct Handles {
    BOOST_HANA_DEFINE_STRUCT(
        Handles,
        (std::shared_ptr<WithOperator>, withOperator),
        (std::shared_ptr<WithEquals>, withEquals),
        (LooseEquals const*, loose),
        (Node*, node)
    );
};

struct Values {
    BOOST_HANA_DEFINE_STRUCT(Values, (WithEquals, withEquals), (LooseEquals, loose), (Opaque, opaque));
};

struct ShortCircuit {
    BOOST_HANA_DEFINE_STRUCT(ShortCircuit, (int, first), (Counted, second));
};

struct Bomb {
    BOOST_HANA_DEFINE_STRUCT(Bomb, (int, id), (Explosive, payload));
};

struct Segment {
    BOOST_HANA_DEFINE_STRUCT(Segment, (Point, from), (Point, to));
};

struct Crate {
    BOOST_HANA_DEFINE_STRUCT(Crate, (int, id), (Unlaid, content));
};

} // namespace strategy_test

using namespace strategy_test;
using fieldwise::EqualityStrategy;
using fieldwise::bind::adapter::FieldTraits;


TEST_CASE("Strategy selection") {
    SECTION("native operator") {
        STATIC_REQUIRE(FieldTraits<int>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<double const>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<bool>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<Color>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<std::string>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<WithOperator>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<std::optional<int>>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<std::optional<WithOperator>>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<char const*>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<int>::hasNativeEqualityOperator);
        STATIC_REQUIRE(FieldTraits<int>::isValueType);
    }

    SECTION("strongly typed equals") {
        STATIC_REQUIRE(FieldTraits<WithEquals>::strategy == EqualityStrategy::StronglyTypedEquals);
        STATIC_REQUIRE(FieldTraits<WithEquals>::hasStronglyTypedEqualsMethod);
        STATIC_REQUIRE_FALSE(FieldTraits<WithEquals>::hasNativeEqualityOperator);
        STATIC_REQUIRE(FieldTraits<BaseWithEquals>::strategy == EqualityStrategy::StronglyTypedEquals);
    }

    SECTION("generic fallback") {
        STATIC_REQUIRE(FieldTraits<LooseEquals>::strategy == EqualityStrategy::GenericFallback);
        STATIC_REQUIRE_FALSE(FieldTraits<LooseEquals>::hasStronglyTypedEqualsMethod);
        STATIC_REQUIRE(FieldTraits<Opaque>::strategy == EqualityStrategy::GenericFallback);
        STATIC_REQUIRE(FieldTraits<std::optional<Opaque>>::strategy == EqualityStrategy::GenericFallback);
    }

    SECTION("object handles describe the referenced class") {
        STATIC_REQUIRE_FALSE(FieldTraits<std::shared_ptr<WithOperator>>::isValueType);
        STATIC_REQUIRE(FieldTraits<std::shared_ptr<WithOperator>>::strategy == EqualityStrategy::NativeOperator);
        STATIC_REQUIRE(FieldTraits<std::unique_ptr<WithEquals>>::strategy == EqualityStrategy::StronglyTypedEquals);
        STATIC_REQUIRE(FieldTraits<LooseEquals const*>::strategy == EqualityStrategy::GenericFallback);
        STATIC_REQUIRE(FieldTraits<Node*>::strategy == EqualityStrategy::GenericFallback);
    }

    SECTION("descriptor reports the selected strategies") {
        auto const& descriptor = fieldwise::ComparatorCache::descriptor<Values>();
        REQUIRE(descriptor.fields_.size() == 3);
        REQUIRE(descriptor.findField("withEquals")->strategy_ == EqualityStrategy::StronglyTypedEquals);
        REQUIRE(descriptor.findField("loose")->strategy_ == EqualityStrategy::GenericFallback);
        REQUIRE(descriptor.findField("opaque")->strategy_ == EqualityStrategy::GenericFallback);
        REQUIRE(descriptor.findField("missing") == nullptr);
    }
}

TEST_CASE("Object handle fields") {
    auto const shared = std::make_shared<WithOperator>(WithOperator{1});
    Node       node{7};
    Node       sameIdNode{7};

    Handles a{shared, std::make_shared<WithEquals>(WithEquals{2}), nullptr, &node};
    Handles b{std::make_shared<WithOperator>(WithOperator{1}), std::make_shared<WithEquals>(WithEquals{2}), nullptr, &node};
    REQUIRE(fieldwise::equal(a, b));

    SECTION("referenced values are compared through their own equality") {
        b.withOperator = std::make_shared<WithOperator>(WithOperator{9});
        REQUIRE_FALSE(fieldwise::equal(a, b));

        b.withOperator = shared;
        b.withEquals   = std::make_shared<WithEquals>(WithEquals{3});
        REQUIRE_FALSE(fieldwise::equal(a, b));
    }

    SECTION("null handles") {
        b.withEquals = nullptr;
        REQUIRE_FALSE(fieldwise::equal(a, b));
        REQUIRE_FALSE(fieldwise::equal(b, a));

        a.withEquals = nullptr;
        REQUIRE(fieldwise::equal(a, b));
    }

    SECTION("mismatched equals is null guarded") {
        LooseEquals left{{4}};
        LooseEquals right{{4}};
        LooseEquals other{{5}};

        a.loose = &left;
        REQUIRE_FALSE(fieldwise::equal(a, b));

        b.loose = &right;
        REQUIRE(fieldwise::equal(a, b));

        b.loose = &other;
        REQUIRE_FALSE(fieldwise::equal(a, b));
    }

    SECTION("no equality degrades to reference equality") {
        b.node = &sameIdNode;
        REQUIRE_FALSE(fieldwise::equal(a, b));
    }
}

TEST_CASE("Value fields without an equality operator") {
    Values a{WithEquals{1}, LooseEquals{{2}}, Opaque{3, 4}};
    Values b{WithEquals{1}, LooseEquals{{2}}, Opaque{3, 4}};
    REQUIRE(fieldwise::equal(a, b));

    b.withEquals.v = 10;
    REQUIRE_FALSE(fieldwise::equal(a, b));
    b.withEquals.v = 1;

    b.loose.v = 20;
    REQUIRE_FALSE(fieldwise::equal(a, b));
    b.loose.v = 2;

    b.opaque.b = 40;
    REQUIRE_FALSE(fieldwise::equal(a, b));
    b.opaque.b = 4;

    REQUIRE(fieldwise::equal(a, b));
}

TEST_CASE("Conjunction stops at the first mismatching field") {
    Counted::comparisons = 0;

    REQUIRE_FALSE(fieldwise::equal(ShortCircuit{1, Counted{5}}, ShortCircuit{2, Counted{5}}));
    REQUIRE(Counted::comparisons == 0);

    REQUIRE(fieldwise::equal(ShortCircuit{1, Counted{5}}, ShortCircuit{1, Counted{5}}));
    REQUIRE(Counted::comparisons == 1);
}

TEST_CASE("Delegated equality failures propagate") {
    REQUIRE_THROWS_MATCHES(
        fieldwise::equal(Bomb{1, {}}, Bomb{1, {}}),
        std::runtime_error,
        Catch::Matchers::Message("delegated equality failed")
    );

    // the failing check is never reached
    REQUIRE_NOTHROW(fieldwise::equal(Bomb{1, {}}, Bomb{2, {}}));
    REQUIRE_FALSE(fieldwise::equal(Bomb{1, {}}, Bomb{2, {}}));
}

TEST_CASE("Registered value fields follow their registered layout") {
    STATIC_REQUIRE(std::has_unique_object_representations_v<Point>);
    (void)fieldwise::registerType(Point::define());

    REQUIRE(fieldwise::equal(Point{1, 2, 100}, Point{1, 2, 200}));

    Segment a{Point{1, 2, 100}, Point{3, 4, 0}};
    Segment b{Point{1, 2, 200}, Point{3, 4, 7}};
    REQUIRE(fieldwise::equal(a, b));
    REQUIRE(fieldwise::equal(std::optional<Point>{a.from}, std::optional<Point>{b.from}));

    b.to.y = 5;
    REQUIRE_FALSE(fieldwise::equal(a, b));
}

TEST_CASE("Nested fields without a layout fail on first comparison") {
    // building the outer descriptor does not touch the nested type
    REQUIRE_THAT(fieldwise::describe<Crate>(), Catch::Matchers::ContainsSubstring("content"));

    // the failing field is never reached
    REQUIRE_FALSE(fieldwise::equal(Crate{1, {}}, Crate{2, {}}));

    try {
        (void)fieldwise::equal(Crate{1, {}}, Crate{1, {}});
        FAIL("expected an introspection failure");
    } catch (fieldwise::FieldwiseException const& e) {
        REQUIRE(e.type() == fieldwise::FieldwiseException::Type::IntrospectionError);
        REQUIRE_THAT(e.message(), Catch::Matchers::ContainsSubstring("Unlaid"));
    }
    REQUIRE_FALSE(fieldwise::ComparatorCache::instance().contains<Unlaid>());
}

TEST_CASE("Types without a layout compare through their own equality") {
    REQUIRE(fieldwise::equal(std::string{"abc"}, std::string{"abc"}));
    REQUIRE_FALSE(fieldwise::equal(std::string{"abc"}, std::string{"abd"}));
    REQUIRE(fieldwise::equal(std::vector<int>{1, 2}, std::vector<int>{1, 2}));
    REQUIRE_FALSE(fieldwise::equal(std::vector<int>{1, 2}, std::vector<int>{1}));

    REQUIRE(fieldwise::equal(WithEquals{1}, WithEquals{1}));
    REQUIRE_FALSE(fieldwise::equal(LooseEquals{{1}}, LooseEquals{{2}}));
    REQUIRE(fieldwise::equal(Opaque{3, 4}, Opaque{3, 4}));
    REQUIRE_FALSE(fieldwise::equal(Opaque{3, 4}, Opaque{3, 5}));

    auto const& descriptor = fieldwise::ComparatorCache::descriptor<Opaque>();
    REQUIRE(descriptor.fields_.size() == 1);
    REQUIRE(descriptor.findField("self") != nullptr);

    REQUIRE_THROWS_AS(fieldwise::equal(Unlaid{1.0}, Unlaid{1.0}), fieldwise::FieldwiseException);
}
