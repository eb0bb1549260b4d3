#include <gtest/gtest.h>

#include "vgc_driver/errors.hpp"
#include "vgc_driver/reply_decoder.hpp"

using namespace vgc_driver;
using namespace vgc_driver::reply_decoder;

TEST(DecodePressure, SecondFieldIsValue)
{
  EXPECT_DOUBLE_EQ(decode_pressure("PR1,7.5e-3"), 7.5e-3);
  EXPECT_DOUBLE_EQ(decode_pressure("0,1.0000E+03\r\n"), 1000.0);
  EXPECT_DOUBLE_EQ(decode_pressure("0, 2.5E-02 ,extra"), 2.5e-2);
}

TEST(DecodePressure, RejectsMalformed)
{
  EXPECT_THROW(decode_pressure("PR1,bogus"), DecodeError);
  EXPECT_THROW(decode_pressure("7.5e-3"), DecodeError);
  EXPECT_THROW(decode_pressure("PR1,1.0abc"), DecodeError);
  EXPECT_THROW(decode_pressure(""), DecodeError);
  EXPECT_THROW(decode_pressure("PR1,"), DecodeError);
}

TEST(DecodeScalar, WholePayload)
{
  EXPECT_DOUBLE_EQ(decode_scalar("25\r\n"), 25.0);
  EXPECT_DOUBLE_EQ(decode_scalar(" -3.5 "), -3.5);
  EXPECT_THROW(decode_scalar("25,1"), DecodeError);
  EXPECT_THROW(decode_scalar("warm"), DecodeError);
}

TEST(DecodeUnit, QueryReplyAndSetEcho)
{
  EXPECT_EQ(decode_unit("3"), 3);
  EXPECT_EQ(decode_unit("UNI,2"), 2);
  EXPECT_EQ(decode_unit("0\r\n"), 0);
  EXPECT_EQ(decode_unit("5"), 5);
}

TEST(DecodeUnit, RejectsOutOfRangeAndJunk)
{
  EXPECT_THROW(decode_unit("6"), DecodeError);
  EXPECT_THROW(decode_unit("-1"), DecodeError);
  EXPECT_THROW(decode_unit("X"), DecodeError);
  EXPECT_THROW(decode_unit("2.5"), DecodeError);
}

TEST(DecodeIdentity, GaugeCountFromTypeDigit)
{
  DeviceIdentity id = decode_identity("VGC503,398-483,44120,010100,010000");
  EXPECT_EQ(id.type, "VGC503");
  EXPECT_EQ(id.model, "398-483");
  EXPECT_EQ(id.serial, 44120);
  EXPECT_EQ(id.firmware, "010100");
  EXPECT_EQ(id.hardware, "010000");
  EXPECT_EQ(id.gauge_count, 3);
}

TEST(DecodeIdentity, FallsBackToModelDigit)
{
  DeviceIdentity id = decode_identity("TPG,DUAL2,123456,1.0,2.1\r\n");
  EXPECT_EQ(id.gauge_count, 2);
  EXPECT_EQ(id.serial, 123456);
}

TEST(DecodeIdentity, NoDigitLeavesGaugeCountUnknown)
{
  EXPECT_EQ(decode_identity("TPG,DUAL,1,1.0,2.1").gauge_count, 0);
}

TEST(DecodeIdentity, RequiresExactlyFiveFields)
{
  EXPECT_THROW(decode_identity("VGC502,398-482,1"), DecodeError);
  EXPECT_THROW(decode_identity("a,b,1,c,d,e"), DecodeError);
  EXPECT_THROW(decode_identity("VGC502,398-482,notserial,1,1"), DecodeError);
}

TEST(UnitName, Table)
{
  EXPECT_STREQ(unit_name(0), "mbar");
  EXPECT_STREQ(unit_name(1), "Torr");
  EXPECT_STREQ(unit_name(2), "Pascal");
  EXPECT_STREQ(unit_name(3), "Micron");
  EXPECT_STREQ(unit_name(4), "hPascal");
  EXPECT_STREQ(unit_name(5), "Volt");
  EXPECT_THROW(unit_name(6), std::invalid_argument);
}

TEST(EscapeBytes, RendersControlBytes)
{
  EXPECT_EQ(escape_bytes("\x06\r\n"), "\\x06\\r\\n");
  EXPECT_EQ(escape_bytes("PR1"), "PR1");
}
