#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "stackpp/vm/value.hpp"
#include "stackpp/vm/printer.hpp"

using namespace stackpp::vm;

TEST(Value, DefaultIsStackEmptyError) {
    Value v;
    EXPECT_EQ(v, Value::error(ErrorKind::StackEmpty));
}

TEST(Value, AsNumber) {
    EXPECT_EQ(asNumber(Value::number(2.5)), 2.5);
    EXPECT_EQ(asNumber(Value::string("12")), 0.0);
    EXPECT_EQ(asNumber(Value::boolean(true)), 0.0);
    EXPECT_EQ(asNumber(Value::error(ErrorKind::StackEmpty)), 0.0);
    EXPECT_EQ(asNumber(Value::block({Value::number(1)})), 0.0);
}

TEST(Value, AsString) {
    EXPECT_EQ(asString(Value::string("hi")), "hi");
    EXPECT_EQ(asString(Value::variable("name")), "name");
    EXPECT_EQ(asString(Value::number(7)), "7");
    EXPECT_EQ(asString(Value::boolean(true)), "");
    EXPECT_EQ(asString(Value::instruction(Opcode::ADD)), "");
    EXPECT_EQ(asString(Value::error(ErrorKind::StackEmpty)), "");
    EXPECT_EQ(asString(Value::block({})), "");
}

TEST(Value, AsBoolOnlyTrustsBools) {
    EXPECT_TRUE(asBool(Value::boolean(true)));
    EXPECT_FALSE(asBool(Value::boolean(false)));
    EXPECT_FALSE(asBool(Value::number(1)));
    EXPECT_FALSE(asBool(Value::string("true")));
    EXPECT_FALSE(asBool(Value::error(ErrorKind::StackEmpty)));
}

TEST(Value, AsBlockWrapsNonBlocks) {
    Value blk = Value::block({Value::number(1), Value::instruction(Opcode::PRINT)});
    auto same = asBlock(blk);
    EXPECT_EQ(same.get(), blk.body.get());

    auto wrapped = asBlock(Value::string("x"));
    ASSERT_EQ(wrapped->size(), 1u);
    EXPECT_EQ((*wrapped)[0], Value::string("x"));
}

TEST(Value, FormatNumber) {
    EXPECT_EQ(formatNumber(7.0), "7");
    EXPECT_EQ(formatNumber(-3.0), "-3");
    EXPECT_EQ(formatNumber(0.5), "0.5");
    EXPECT_EQ(formatNumber(0.1), "0.1");
    EXPECT_EQ(formatNumber(0.1 + 0.2), "0.30000000000000004");
    EXPECT_EQ(formatNumber(1e21), "1000000000000000000000");
    EXPECT_EQ(formatNumber(-0.0), "-0");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(formatNumber(-std::numeric_limits<double>::infinity()), "-inf");
    EXPECT_EQ(formatNumber(std::nan("")), "NaN");
}

TEST(Value, StructuralEquality) {
    EXPECT_EQ(Value::block({Value::number(1)}), Value::block({Value::number(1)}));
    EXPECT_NE(Value::block({Value::number(1)}), Value::block({Value::number(2)}));
    EXPECT_NE(Value::string("x"), Value::variable("x"));
    EXPECT_NE(Value::number(0), Value::boolean(false));
}

TEST(Value, CopiesShareImmutableBlockBody) {
    Value a = Value::block({Value::number(1)});
    Value b = a;
    EXPECT_EQ(a.body.get(), b.body.get());
}
