#include "di/test/prelude.h"
#include "vtcore/params.h"

namespace params {
static void basic() {
    auto params = vtcore::Params({ { 1, 2 }, { 3 }, { 4, 5, 6 } });

    ASSERT_EQ(params.size(), 3);
    ASSERT_EQ(params.get(0), 1);
    ASSERT_EQ(params.get(1), 3);
    ASSERT_EQ(params.get(2), 4);
    ASSERT_EQ(params.get(3), 0);
    ASSERT_EQ(params.get(3, 29), 29);
    ASSERT(!params.empty());

    ASSERT_EQ(params.subparams(0).size(), 2);
    ASSERT_EQ(params.subparams(0).get(1), 2);
    ASSERT_EQ(params.subparams(0).get(2, 33), 33);
    ASSERT(params.subparams(4).empty());

    ASSERT_EQ(params.get_subparam(2, 1), 5);
    ASSERT_EQ(params.get_subparam(2, 3, 77), 77);

    auto built = vtcore::Params();
    ASSERT(built.empty());
    ASSERT_NOT_EQ(built, params);

    built.add_subparams({ 1, 2 });
    built.add_param(3);
    built.add_subparams({ 4, 5, 6 });
    ASSERT_EQ(params, built);
}

static void omitted() {
    auto params = vtcore::Params({ { 0 }, {}, { 7 } });

    ASSERT(params.has(0));
    ASSERT(!params.has(1));
    ASSERT(params.has(2));
    ASSERT(!params.has(3));

    ASSERT_EQ(params.get_nonzero(0), 1);
    ASSERT_EQ(params.get_nonzero(1), 1);
    ASSERT_EQ(params.get_nonzero(2), 7);
    ASSERT_EQ(params.get_nonzero(5, 3), 3);
}

static void parse() {
    auto params = vtcore::Params::from_string("12;3:45:7;1;2:3"_sv);
    auto expected = vtcore::Params({ { 12 }, { 3, 45, 7 }, { 1 }, { 2, 3 } });
    ASSERT_EQ(params, expected);

    ASSERT(vtcore::Params::from_string(""_sv).empty());
}

static void saturate() {
    ASSERT_EQ(vtcore::Param::parse("65535"_sv), vtcore::Param(65535));
    ASSERT_EQ(vtcore::Param::parse("65536"_sv), vtcore::Param(65535));
    ASSERT_EQ(vtcore::Param::parse("99999999999999999999"_sv).value(), 65535u);
    ASSERT_EQ(vtcore::Param(100000).value(), 65535u);

    ASSERT(!vtcore::Param::parse(""_sv).has_value());
    ASSERT(!vtcore::Param::parse("1x"_sv).has_value());

    auto params = vtcore::Params::from_string("70000;2"_sv);
    ASSERT_EQ(params.get(0), 65535u);
    ASSERT_EQ(params.get(1), 2u);
}

static void to_string() {
    auto params = vtcore::Params({ { 12 }, { 3, 45, 7 }, { 1 }, { 2, 3 } });

    ASSERT_EQ(params.to_string(), "12;3:45:7;1;2:3"_sv);
}

TEST(params, basic)
TEST(params, omitted)
TEST(params, parse)
TEST(params, saturate)
TEST(params, to_string)
}
