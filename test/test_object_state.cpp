#include "exception.hpp"
#include "object_state.hpp"
#include <gtest/gtest.h>

using namespace docjson;

namespace {

JsonErrorCode error_of(JsonObjectState &state, JsonTokenType token) {
  try {
    state.register_token(token);
  } catch (const docjson::exception &e) {
    return e.code();
  }
  ADD_FAILURE() << "expected an exception for " << to_string(token);
  return JsonErrorCode::InvalidArgument;
}

} // namespace

TEST(ObjectStateTest, TracksObjectWithNestedArray) {
  JsonObjectState state(false);

  state.register_token(JsonTokenType::BeginObject);
  ASSERT_EQ(state.current_depth(), 1);
  ASSERT_TRUE(state.in_object_context());
  ASSERT_TRUE(state.is_property_expected());

  state.register_token(JsonTokenType::FieldName);
  ASSERT_FALSE(state.is_property_expected());
  state.register_token(JsonTokenType::Number);
  ASSERT_TRUE(state.is_property_expected());

  state.register_token(JsonTokenType::FieldName);
  state.register_token(JsonTokenType::BeginArray);
  ASSERT_EQ(state.current_depth(), 2);
  ASSERT_TRUE(state.in_array_context());
  ASSERT_FALSE(state.is_property_expected());

  state.register_token(JsonTokenType::True);
  state.register_token(JsonTokenType::Null);
  state.register_token(JsonTokenType::EndArray);
  ASSERT_EQ(state.current_depth(), 1);
  ASSERT_TRUE(state.in_object_context());

  state.register_token(JsonTokenType::EndObject);
  ASSERT_EQ(state.current_depth(), 0);
  ASSERT_EQ(state.current_token_type(), JsonTokenType::EndObject);
}

TEST(ObjectStateTest, ValueInObjectNeedsFieldName) {
  JsonObjectState state(false);
  state.register_token(JsonTokenType::BeginObject);
  ASSERT_EQ(error_of(state, JsonTokenType::String), JsonErrorCode::MissingProperty);
}

TEST(ObjectStateTest, SecondRootValueIsRejected) {
  JsonObjectState state(false);
  state.register_token(JsonTokenType::Number);
  ASSERT_EQ(error_of(state, JsonTokenType::Number), JsonErrorCode::PropertyArrayOrObjectNotStarted);
}

TEST(ObjectStateTest, FieldNameOutsideObject) {
  JsonObjectState state(false);
  ASSERT_EQ(error_of(state, JsonTokenType::FieldName), JsonErrorCode::ObjectNotStarted);

  JsonObjectState in_array(false);
  in_array.register_token(JsonTokenType::BeginArray);
  ASSERT_EQ(error_of(in_array, JsonTokenType::FieldName), JsonErrorCode::ObjectNotStarted);
}

TEST(ObjectStateTest, TwoFieldNamesInARow) {
  JsonObjectState state(false);
  state.register_token(JsonTokenType::BeginObject);
  state.register_token(JsonTokenType::FieldName);
  ASSERT_EQ(error_of(state, JsonTokenType::FieldName), JsonErrorCode::PropertyAlreadyAdded);
}

TEST(ObjectStateTest, EndTokenErrorsDependOnMode) {
  JsonObjectState writer(false);
  ASSERT_EQ(error_of(writer, JsonTokenType::EndArray), JsonErrorCode::ArrayNotStarted);
  JsonObjectState writer2(false);
  ASSERT_EQ(error_of(writer2, JsonTokenType::EndObject), JsonErrorCode::ObjectNotStarted);

  JsonObjectState reader(true);
  ASSERT_EQ(error_of(reader, JsonTokenType::EndArray), JsonErrorCode::UnexpectedEndArray);
  JsonObjectState reader2(true);
  ASSERT_EQ(error_of(reader2, JsonTokenType::EndObject), JsonErrorCode::UnexpectedEndObject);
}

TEST(ObjectStateTest, MismatchedEndTokens) {
  JsonObjectState state(false);
  state.register_token(JsonTokenType::BeginArray);
  ASSERT_EQ(error_of(state, JsonTokenType::EndObject), JsonErrorCode::ObjectNotStarted);

  JsonObjectState reader(true);
  reader.register_token(JsonTokenType::BeginObject);
  ASSERT_EQ(error_of(reader, JsonTokenType::EndArray), JsonErrorCode::UnexpectedEndArray);
}

TEST(ObjectStateTest, DanglingFieldNameAtObjectEnd) {
  JsonObjectState writer(false);
  writer.register_token(JsonTokenType::BeginObject);
  writer.register_token(JsonTokenType::FieldName);
  ASSERT_EQ(error_of(writer, JsonTokenType::EndObject), JsonErrorCode::NotComplete);

  JsonObjectState reader(true);
  reader.register_token(JsonTokenType::BeginObject);
  reader.register_token(JsonTokenType::FieldName);
  ASSERT_EQ(error_of(reader, JsonTokenType::EndObject), JsonErrorCode::UnexpectedEndObject);
}

TEST(ObjectStateTest, MaxNestingDepth) {
  JsonObjectState state(false);
  for (size_t i = 0; i < config::max_nesting_depth; ++i) {
    state.register_token(i % 2 == 0 ? JsonTokenType::BeginArray : JsonTokenType::BeginObject);
    if (i % 2 == 1) {
      state.register_token(JsonTokenType::FieldName);
    }
  }
  ASSERT_EQ(state.current_depth(), static_cast<int>(config::max_nesting_depth));
  // the innermost object has a field name waiting for its value
  ASSERT_EQ(error_of(state, JsonTokenType::BeginArray), JsonErrorCode::MaxNestingExceeded);
}

TEST(ObjectStateTest, ContextSurvivesDeepNesting) {
  JsonObjectState state(true);
  // alternate contexts past the first bitmap byte
  for (int i = 0; i < 20; ++i) {
    if (i % 3 == 0) {
      state.register_token(JsonTokenType::BeginObject);
      state.register_token(JsonTokenType::FieldName);
    } else {
      state.register_token(JsonTokenType::BeginArray);
    }
  }
  for (int i = 19; i >= 0; --i) {
    if (i % 3 == 0) {
      ASSERT_TRUE(state.in_object_context()) << "level " << i;
      state.register_token(JsonTokenType::EndObject);
    } else {
      ASSERT_TRUE(state.in_array_context()) << "level " << i;
      state.register_token(JsonTokenType::EndArray);
    }
  }
  ASSERT_EQ(state.current_depth(), 0);
}
