/**
 * @file test_predicate_resolver.cpp
 * @brief Tests for resolving CUSTOM skip checks
 */

#include <gtest/gtest.h>
#include "cfgbind/PredicateResolver.hpp"
#include "cfgbind/Errors.hpp"

#include <string>

using namespace cfgbind;

namespace {

struct Target {
    std::string name;
    int plain = 0;
    int calls = 0;
    Predicate skip_field = [](const RawValue& raw) { return raw.is_null(); };
    Predicate both;
    Predicate unset;

    bool skip_method(const RawValue& raw) {
        ++calls;
        return raw.is_present() && raw.value() == "skip me";
    }
    bool both_method(const RawValue&) const { return true; }
    bool wrong_arity(const RawValue&, int) const { return true; }
    int wrong_return(const RawValue&) const { return 1; }
    bool wrong_param(const std::string&) const { return true; }
    static bool always(const RawValue&) { return true; }
    bool is_blank(const RawValue& raw) const noexcept {
        return raw.is_present() && raw.value() == "";
    }
    bool by_value(RawValue) noexcept { return false; }
    static bool never(const RawValue&) noexcept { return false; }
};

struct Checks {
    static Predicate skip_negative;
    static Predicate skip_unset;
    static bool skip_port(const RawValue& raw) {
        return raw.is_present() && raw.value() == 0;
    }
    bool instance_check(const RawValue&) const { return true; }
    Predicate instance_predicate;
};

Predicate Checks::skip_unset;

Predicate Checks::skip_negative = [](const RawValue& raw) {
    return raw.is_present() && raw.value().is_number() && raw.value().get<double>() < 0;
};

struct Undescribed {};

const std::type_index kCurrent = typeid(CurrentType);

} // namespace

class PredicateResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Describe<Target>("Target")
            .property("name", &Target::name)
            .field("plain", &Target::plain)
            .field("skip_field", &Target::skip_field)
            .method("skip_method", &Target::skip_method)
            .method("wrong_arity", &Target::wrong_arity)
            .method("wrong_return", &Target::wrong_return)
            .method("wrong_param", &Target::wrong_param)
            .field("both", &Target::both)
            .method("both", &Target::both_method)
            .static_method("always", &Target::always)
            .field("unset", &Target::unset)
            .method("is_blank", &Target::is_blank)
            .method("by_value", &Target::by_value)
            .static_method("never", &Target::never)
            .commit(registry);

        Describe<Checks>("Checks")
            .static_field("skip_negative", &Checks::skip_negative)
            .static_field("skip_unset", &Checks::skip_unset)
            .static_method("skip_port", &Checks::skip_port)
            .method("instance_check", &Checks::instance_check)
            .field("instance_predicate", &Checks::instance_predicate)
            .commit(registry);
    }

    ResolutionFailure failure_of(std::type_index type, const std::string& member) {
        try {
            resolver.resolve(type, member, ObjectRef::of(target));
        } catch (const PredicateResolutionError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "resolving '" << member << "' should have failed";
        return ResolutionFailure::not_found;
    }

    TypeRegistry registry;
    PredicateResolver resolver{registry};
    Target target;
};

// ============================================================================
// Current type
// ============================================================================

TEST_F(PredicateResolverTest, PredicateFieldOfCurrentObject) {
    auto handle = resolver.resolve(kCurrent, "skip_field", ObjectRef::of(target));

    EXPECT_EQ(handle.shape(), PredicateHandle::Shape::stored_predicate);
    EXPECT_TRUE(handle(RawValue::null()));
    EXPECT_FALSE(handle(RawValue::absent()));
}

TEST_F(PredicateResolverTest, StoredPredicateSeesLaterAssignments) {
    auto handle = resolver.resolve(kCurrent, "skip_field", ObjectRef::of(target));
    target.skip_field = [](const RawValue&) { return true; };

    EXPECT_TRUE(handle(RawValue(Value(1))));
}

TEST_F(PredicateResolverTest, MethodIsBoundToTheCurrentObject) {
    auto handle = resolver.resolve(kCurrent, "skip_method", ObjectRef::of(target));

    EXPECT_EQ(handle.shape(), PredicateHandle::Shape::bound_method);
    EXPECT_TRUE(handle(RawValue(Value("skip me"))));
    EXPECT_FALSE(handle(RawValue(Value("keep me"))));
    EXPECT_EQ(target.calls, 2);
}

TEST_F(PredicateResolverTest, MethodIsReboundForEachObject) {
    Target other;
    auto first = resolver.resolve(kCurrent, "skip_method", ObjectRef::of(target));
    auto second = resolver.resolve(kCurrent, "skip_method", ObjectRef::of(other));

    first(RawValue::absent());
    second(RawValue::absent());
    second(RawValue::absent());

    EXPECT_EQ(target.calls, 1);
    EXPECT_EQ(other.calls, 2);
}

TEST_F(PredicateResolverTest, NoexceptMethodsAreResolved) {
    auto blank = resolver.resolve(kCurrent, "is_blank", ObjectRef::of(target));
    auto by_value = resolver.resolve(kCurrent, "by_value", ObjectRef::of(target));
    auto never = resolver.resolve(kCurrent, "never", ObjectRef::of(target));

    EXPECT_EQ(blank.shape(), PredicateHandle::Shape::bound_method);
    EXPECT_TRUE(blank(RawValue(Value(""))));
    EXPECT_FALSE(blank(RawValue::absent()));
    EXPECT_FALSE(by_value(RawValue::null()));
    EXPECT_EQ(never.shape(), PredicateHandle::Shape::static_method);
    EXPECT_FALSE(never(RawValue::absent()));
}

TEST_F(PredicateResolverTest, StaticMethodOfCurrentType) {
    auto handle = resolver.resolve(kCurrent, "always", ObjectRef::of(target));

    EXPECT_EQ(handle.shape(), PredicateHandle::Shape::static_method);
    EXPECT_TRUE(handle(RawValue::absent()));
}

// ============================================================================
// Another declaring type
// ============================================================================

TEST_F(PredicateResolverTest, StaticPredicateFieldOfAnotherType) {
    auto handle = resolver.resolve(typeid(Checks), "skip_negative", ObjectRef::of(target));

    EXPECT_EQ(handle.shape(), PredicateHandle::Shape::stored_predicate);
    EXPECT_TRUE(handle(RawValue(Value(-1))));
    EXPECT_FALSE(handle(RawValue(Value(1))));
}

TEST_F(PredicateResolverTest, StaticMethodOfAnotherType) {
    auto handle = resolver.resolve(typeid(Checks), "skip_port", ObjectRef::of(target));

    EXPECT_EQ(handle.shape(), PredicateHandle::Shape::static_method);
    EXPECT_TRUE(handle(RawValue(Value(0))));
    EXPECT_FALSE(handle(RawValue(Value(8080))));
}

TEST_F(PredicateResolverTest, StaticHandlesSurviveCacheClear) {
    auto cached = resolver.resolve(typeid(Checks), "skip_port", ObjectRef());
    resolver.clear_cache();
    auto fresh = resolver.resolve(typeid(Checks), "skip_port", ObjectRef());

    EXPECT_EQ(cached(RawValue(Value(0))), fresh(RawValue(Value(0))));
}

TEST_F(PredicateResolverTest, NonStaticMethodOfAnotherTypeIsRejected) {
    EXPECT_EQ(failure_of(typeid(Checks), "instance_check"), ResolutionFailure::not_static);
}

TEST_F(PredicateResolverTest, InstancePredicateFieldOfAnotherTypeIsRejected) {
    EXPECT_EQ(failure_of(typeid(Checks), "instance_predicate"), ResolutionFailure::not_static);
}

TEST_F(PredicateResolverTest, ExplicitCurrentTypeStillRequiresStatic) {
    EXPECT_EQ(failure_of(typeid(Target), "skip_method"), ResolutionFailure::not_static);
    EXPECT_NO_THROW(resolver.resolve(typeid(Target), "always", ObjectRef::of(target)));
}

TEST_F(PredicateResolverTest, UndescribedTypeIsRejected) {
    EXPECT_EQ(failure_of(typeid(Undescribed), "anything"), ResolutionFailure::unknown_type);
}

// ============================================================================
// Resolution errors
// ============================================================================

TEST_F(PredicateResolverTest, FieldAndMethodWithSameNameAreAmbiguous) {
    EXPECT_EQ(failure_of(kCurrent, "both"), ResolutionFailure::ambiguous);
}

TEST_F(PredicateResolverTest, UnknownMemberIsNotFound) {
    EXPECT_EQ(failure_of(kCurrent, "nope"), ResolutionFailure::not_found);
}

TEST_F(PredicateResolverTest, NonPredicateFieldHasWrongShape) {
    EXPECT_EQ(failure_of(kCurrent, "plain"), ResolutionFailure::wrong_field_shape);
    EXPECT_EQ(failure_of(kCurrent, "name"), ResolutionFailure::wrong_field_shape);
}

TEST_F(PredicateResolverTest, MethodsWithWrongSignatureHaveWrongShape) {
    EXPECT_EQ(failure_of(kCurrent, "wrong_arity"), ResolutionFailure::wrong_method_shape);
    EXPECT_EQ(failure_of(kCurrent, "wrong_return"), ResolutionFailure::wrong_method_shape);
    EXPECT_EQ(failure_of(kCurrent, "wrong_param"), ResolutionFailure::wrong_method_shape);
}

TEST_F(PredicateResolverTest, ErrorNamesTypeAndMember) {
    try {
        resolver.resolve(kCurrent, "nope", ObjectRef::of(target));
        FAIL() << "Should have thrown PredicateResolutionError";
    } catch (const PredicateResolutionError& e) {
        EXPECT_EQ(e.declaring_type(), "Target");
        EXPECT_EQ(e.member(), "nope");
        std::string msg = e.what();
        EXPECT_NE(msg.find("Target"), std::string::npos);
        EXPECT_NE(msg.find("nope"), std::string::npos);

        auto attributed = e.with_field("name");
        EXPECT_EQ(attributed.field(), "name");
        EXPECT_NE(std::string(attributed.what()).find("'name'"), std::string::npos);
    }
}

TEST_F(PredicateResolverTest, UnsetPredicateFieldIsRejected) {
    EXPECT_EQ(failure_of(kCurrent, "unset"), ResolutionFailure::unset_predicate);
    EXPECT_EQ(failure_of(typeid(Checks), "skip_unset"), ResolutionFailure::unset_predicate);
}

TEST_F(PredicateResolverTest, AssignedPredicateFieldResolves) {
    target.unset = [](const RawValue& raw) { return raw.is_absent(); };
    auto handle = resolver.resolve(kCurrent, "unset", ObjectRef::of(target));
    EXPECT_TRUE(handle(RawValue::absent()));
}

TEST_F(PredicateResolverTest, UnsetPredicateErrorNamesMember) {
    try {
        resolver.resolve(kCurrent, "unset", ObjectRef::of(target));
        FAIL() << "Should have thrown PredicateResolutionError";
    } catch (const PredicateResolutionError& e) {
        EXPECT_EQ(e.declaring_type(), "Target");
        EXPECT_EQ(e.member(), "unset");
        EXPECT_NE(std::string(e.what()).find("not set"), std::string::npos);
    }
}
