#include "exception.hpp"
#include "text_reader.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace docjson;

namespace {

std::vector<JsonTokenType> tokens_of(std::string_view text) {
  JsonTextReader reader(bytes_of(text));
  std::vector<JsonTokenType> tokens;
  while (reader.read()) {
    tokens.push_back(reader.current_token_type());
  }
  return tokens;
}

JsonErrorCode read_error(std::string_view text) {
  JsonTextReader reader(bytes_of(text));
  try {
    while (reader.read()) {
    }
  } catch (const docjson::exception &e) {
    return e.code();
  }
  ADD_FAILURE() << "expected an exception reading '" << text << "'";
  return JsonErrorCode::InvalidArgument;
}

// Reads until the reader stands on a token of the given type.
void read_to(JsonTextReader &reader, JsonTokenType type) {
  while (reader.read()) {
    if (reader.current_token_type() == type) {
      return;
    }
  }
  FAIL() << "no " << to_string(type) << " token";
}

} // namespace

TEST(TextReaderTest, TokenSequence) {
  std::vector<JsonTokenType> expected = {
      JsonTokenType::BeginObject, JsonTokenType::FieldName, JsonTokenType::Number,
      JsonTokenType::FieldName,   JsonTokenType::BeginArray, JsonTokenType::True,
      JsonTokenType::Null,        JsonTokenType::EndArray,   JsonTokenType::EndObject};
  ASSERT_EQ(tokens_of(R"({"a":1,"b":[true,null]})"), expected);
  ASSERT_EQ(tokens_of(" \r\n\t{ \"a\" :\n1 , \"b\" : [ true , null ] }\n"), expected);
}

TEST(TextReaderTest, ScalarRoots) {
  ASSERT_EQ(tokens_of("false"), std::vector<JsonTokenType>{JsonTokenType::False});
  ASSERT_EQ(tokens_of("\"s\""), std::vector<JsonTokenType>{JsonTokenType::String});
  ASSERT_EQ(tokens_of("  -12.5e-1 "), std::vector<JsonTokenType>{JsonTokenType::Number});
  ASSERT_TRUE(tokens_of("   ").empty());
  ASSERT_TRUE(tokens_of("").empty());
}

TEST(TextReaderTest, TypedValues) {
  JsonTextReader reader(bytes_of(
      "[I-5,H300,L7,LL-9,UL4000000000,S1.5,D0.25,G00112233-4455-6677-8899-aabbccddeeff,BaGk=,B]"));
  ASSERT_TRUE(reader.read());
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.current_token_type(), JsonTokenType::Int8);
  ASSERT_EQ(reader.get_int8_value(), -5);
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_int16_value(), 300);
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_int32_value(), 7);
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_int64_value(), -9);
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_uint32_value(), 4000000000u);
  ASSERT_TRUE(reader.read());
  ASSERT_FLOAT_EQ(reader.get_float32_value(), 1.5f);
  ASSERT_TRUE(reader.read());
  ASSERT_DOUBLE_EQ(reader.get_float64_value(), 0.25);
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_guid_value().to_string(), "00112233-4455-6677-8899-aabbccddeeff");
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.current_token_type(), JsonTokenType::Binary);
  ASSERT_EQ(text_of(reader.get_binary_value()), "hi");
  ASSERT_TRUE(reader.read());
  ASSERT_TRUE(reader.get_binary_value().empty());
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.current_token_type(), JsonTokenType::EndArray);
  ASSERT_FALSE(reader.read());
}

TEST(TextReaderTest, NumberValues) {
  JsonTextReader reader(bytes_of("[-0, 1.5e3, 12345678901234567890, -9223372036854775808, 0.1]"));
  reader.read();

  ASSERT_TRUE(reader.read());
  Number64 zero = reader.get_number_value();
  ASSERT_TRUE(zero.is_integer());
  ASSERT_EQ(zero.to_int64(), 0);

  ASSERT_TRUE(reader.read());
  Number64 exp = reader.get_number_value();
  ASSERT_TRUE(exp.is_double());
  ASSERT_DOUBLE_EQ(exp.to_double(), 1500.0);

  ASSERT_TRUE(reader.read());
  Number64 big = reader.get_number_value();
  ASSERT_TRUE(big.is_double());
  ASSERT_DOUBLE_EQ(big.to_double(), 12345678901234567890.0);

  ASSERT_TRUE(reader.read());
  Number64 min = reader.get_number_value();
  ASSERT_TRUE(min.is_integer());
  ASSERT_EQ(min.to_int64(), std::numeric_limits<int64_t>::min());

  ASSERT_TRUE(reader.read());
  ASSERT_DOUBLE_EQ(reader.get_number_value().to_double(), 0.1);
}

TEST(TextReaderTest, NumbersBeyondDoubleRange) {
  JsonTextReader reader(bytes_of("[1e400, -1E+400, 1e-400, -0.0001e-399, 0.5e309]"));
  reader.read();

  ASSERT_TRUE(reader.read());
  Number64 huge = reader.get_number_value();
  ASSERT_TRUE(std::isinf(huge.to_double()));
  ASSERT_GT(huge.to_double(), 0.0);

  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_number_value().to_double(), -std::numeric_limits<double>::infinity());

  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_number_value().to_double(), 0.0);

  ASSERT_TRUE(reader.read());
  Number64 tiny = reader.get_number_value();
  ASSERT_EQ(tiny.to_double(), 0.0);
  ASSERT_TRUE(std::signbit(tiny.to_double()));

  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_number_value().to_double(), std::numeric_limits<double>::infinity());
}

TEST(TextReaderTest, StringValues) {
  JsonTextReader reader(bytes_of(R"({"plain":"a\"bé😀\/"})"));
  reader.read();

  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.current_token_type(), JsonTokenType::FieldName);
  std::string_view buffered;
  ASSERT_TRUE(reader.try_get_buffered_string_value(buffered));
  ASSERT_EQ(buffered, "plain");
  ASSERT_EQ(reader.get_string_value(), "plain");
  ASSERT_FALSE(reader.token_escaped());

  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.current_token_type(), JsonTokenType::String);
  ASSERT_TRUE(reader.token_escaped());
  ASSERT_FALSE(reader.try_get_buffered_string_value(buffered));
  ASSERT_EQ(reader.get_string_value(), "a\"b\xc3\xa9\xf0\x9f\x98\x80/");
}

TEST(TextReaderTest, UnicodeEscapes) {
  JsonTextReader reader(bytes_of(R"(["\u00e9\ud83d\ude00", "\u0041\n"])"));
  reader.read();
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_string_value(), "\xc3\xa9\xf0\x9f\x98\x80");
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(reader.get_string_value(), "A\n");
}

TEST(TextReaderTest, NonFiniteSentinelsDecodeAsStrings) {
  JsonTextReader reader(bytes_of(R"(["NaN","Infinity","-Infinity"])"));
  reader.read();
  for (const char *expected : {"NaN", "Infinity", "-Infinity"}) {
    ASSERT_TRUE(reader.read());
    ASSERT_EQ(reader.current_token_type(), JsonTokenType::String);
    ASSERT_EQ(reader.get_string_value(), expected);
  }
}

TEST(TextReaderTest, RawTokens) {
  JsonTextReader reader(bytes_of(R"({ "a" : LL5 })"));
  reader.read();
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(text_of(reader.get_buffered_raw_json_token()), "\"a\"");
  ASSERT_EQ(reader.token_start(), 2u);
  ASSERT_EQ(reader.token_end(), 5u);
  ASSERT_TRUE(reader.read());
  ASSERT_EQ(text_of(reader.get_buffered_raw_json_token()), "LL5");
}

TEST(TextReaderTest, TypeMismatch) {
  JsonTextReader reader(bytes_of("[1]"));
  read_to(reader, JsonTokenType::Number);
  try {
    reader.get_int8_value();
    FAIL() << "expected an exception";
  } catch (const docjson::exception &e) {
    ASSERT_EQ(e.code(), JsonErrorCode::TypeMismatch);
  }
  ASSERT_THROW(reader.get_string_value(), docjson::exception);
}

TEST(TextReaderTest, TypedValueOutOfRange) {
  JsonTextReader reader(bytes_of("[I300]"));
  read_to(reader, JsonTokenType::Int8);
  try {
    reader.get_int8_value();
    FAIL() << "expected an exception";
  } catch (const docjson::exception &e) {
    ASSERT_EQ(e.code(), JsonErrorCode::InvalidNumber);
  }
}

TEST(TextReaderTest, SeparatorErrors) {
  ASSERT_EQ(read_error("[1,]"), JsonErrorCode::UnexpectedEndArray);
  ASSERT_EQ(read_error(R"({"a":1,})"), JsonErrorCode::UnexpectedEndObject);
  ASSERT_EQ(read_error(R"({"a" 1})"), JsonErrorCode::MissingNameSeparator);
  ASSERT_EQ(read_error("[1 2]"), JsonErrorCode::UnexpectedToken);
  ASSERT_EQ(read_error("[,1]"), JsonErrorCode::UnexpectedValueSeparator);
  ASSERT_EQ(read_error("[1,,2]"), JsonErrorCode::UnexpectedValueSeparator);
  ASSERT_EQ(read_error("1,2"), JsonErrorCode::UnexpectedValueSeparator);
  ASSERT_EQ(read_error("{:1}"), JsonErrorCode::UnexpectedNameSeparator);
  ASSERT_EQ(read_error(R"({"a"::1})"), JsonErrorCode::UnexpectedNameSeparator);
  ASSERT_EQ(read_error(R"(["a":2])"), JsonErrorCode::UnexpectedNameSeparator);
  ASSERT_EQ(read_error("[1:2]"), JsonErrorCode::InvalidNumber);
}

TEST(TextReaderTest, GrammarErrors) {
  ASSERT_EQ(read_error("1 2"), JsonErrorCode::PropertyArrayOrObjectNotStarted);
  ASSERT_EQ(read_error("]"), JsonErrorCode::UnexpectedEndArray);
  ASSERT_EQ(read_error("[}"), JsonErrorCode::UnexpectedEndObject);
  ASSERT_EQ(read_error("{1 :2}"), JsonErrorCode::MissingProperty);
  ASSERT_EQ(read_error(R"({"a":})"), JsonErrorCode::UnexpectedEndObject);
}

TEST(TextReaderTest, IncompleteDocuments) {
  ASSERT_EQ(read_error("[1"), JsonErrorCode::MissingEndArray);
  ASSERT_EQ(read_error(R"({"a":[]  )"), JsonErrorCode::MissingEndObject);
  ASSERT_EQ(read_error("\"abc"), JsonErrorCode::MissingClosingQuote);
  ASSERT_EQ(read_error("\"abc\\"), JsonErrorCode::MissingClosingQuote);
}

TEST(TextReaderTest, TokenFormErrors) {
  ASSERT_EQ(read_error(R"("\x")"), JsonErrorCode::InvalidEscapedCharacter);
  ASSERT_EQ(read_error(R"("\u12G4")"), JsonErrorCode::InvalidEscapedCharacter);
  ASSERT_EQ(read_error("01"), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("1."), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("1e"), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("1x"), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("-"), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("[L]"), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("UL-1"), JsonErrorCode::InvalidNumber);
  ASSERT_EQ(read_error("UX1"), JsonErrorCode::InvalidToken);
  ASSERT_EQ(read_error("tru"), JsonErrorCode::InvalidToken);
  ASSERT_EQ(read_error("nul1"), JsonErrorCode::InvalidToken);
  ASSERT_EQ(read_error("G1234"), JsonErrorCode::InvalidToken);
  ASSERT_EQ(read_error("@"), JsonErrorCode::UnexpectedToken);
}

TEST(TextReaderTest, NestingLimit) {
  std::string deepest(config::max_nesting_depth, '[');
  deepest.append(config::max_nesting_depth, ']');
  ASSERT_EQ(tokens_of(deepest).size(), 2 * config::max_nesting_depth);

  std::string too_deep(config::max_nesting_depth + 1, '[');
  too_deep.append(config::max_nesting_depth + 1, ']');
  ASSERT_EQ(read_error(too_deep), JsonErrorCode::MaxNestingExceeded);
}
