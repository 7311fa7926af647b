#include "binary_writer.hpp"
#include "exception.hpp"
#include "navigator.hpp"
#include "reader.hpp"
#include "text_writer.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <functional>
#include <memory>

using namespace docjson;

namespace {

const std::string sample_text = R"({"id":"x1","tags":["a","b\n"],"n":-2.5,"big":12345678901,)"
                                R"("t":[I-5,H300,L7,LL-9,UL4000000000,S1.5,D0.25,G00112233-4455-6677-8899-aabbccddeeff,BaGk=],)"
                                R"("e":{},"a":[],"z":[null,true,false],"nested":{"k":[1,{"q":null}]}})";

JsonErrorCode error_of(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const docjson::exception &e) {
    return e.code();
  }
  ADD_FAILURE() << "expected an exception";
  return JsonErrorCode::InvalidArgument;
}

JsonNavigatorNode property(const IJsonNavigator &navigator, JsonNavigatorNode object, std::string_view name) {
  ObjectProperty found;
  EXPECT_TRUE(navigator.try_get_object_property(object, name, found)) << name;
  return found.value_node;
}

std::vector<std::byte> to_binary(std::span<const std::byte> buffer, const JsonWriterOptions &options = {}) {
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(buffer);
  JsonBinaryWriter writer(options);
  navigator->write_to(navigator->get_root_node(), writer);
  return copy_of(writer.get_result());
}

std::string to_text(std::span<const std::byte> buffer, const JsonStringDictionary *dictionary = nullptr) {
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(buffer, dictionary);
  JsonTextWriter writer;
  navigator->write_to(navigator->get_root_node(), writer);
  return text_of(writer.get_result());
}

// Checks what both navigator flavours have to agree on.
void check_sample(const IJsonNavigator &navigator) {
  JsonNavigatorNode root = navigator.get_root_node();
  ASSERT_EQ(navigator.get_node_type(root), JsonNodeType::Object);
  ASSERT_EQ(navigator.get_object_property_count(root), 9u);

  ASSERT_EQ(navigator.get_string_value(property(navigator, root, "id")), "x1");
  ASSERT_EQ(navigator.get_number_value(property(navigator, root, "n")), Number64(-2.5));
  ASSERT_EQ(navigator.get_number_value(property(navigator, root, "big")), Number64(12345678901LL));

  ObjectProperty missing;
  ASSERT_FALSE(navigator.try_get_object_property(root, "missing", missing));

  JsonNavigatorNode tags = property(navigator, root, "tags");
  ASSERT_EQ(navigator.get_node_type(tags), JsonNodeType::Array);
  ASSERT_EQ(navigator.get_array_item_count(tags), 2u);
  ASSERT_EQ(navigator.get_string_value(navigator.get_array_item_at(tags, 1)), "b\n");
  ASSERT_EQ(error_of([&] { navigator.get_array_item_at(tags, 2); }), JsonErrorCode::IndexOutOfRange);

  JsonNavigatorNode typed = property(navigator, root, "t");
  std::vector<JsonNavigatorNode> items = navigator.get_array_items(typed);
  ASSERT_EQ(items.size(), 9u);
  ASSERT_EQ(navigator.get_node_type(items[0]), JsonNodeType::Int8);
  ASSERT_EQ(navigator.get_int8_value(items[0]), -5);
  ASSERT_EQ(navigator.get_int16_value(items[1]), 300);
  ASSERT_EQ(navigator.get_int32_value(items[2]), 7);
  ASSERT_EQ(navigator.get_int64_value(items[3]), -9);
  ASSERT_EQ(navigator.get_uint32_value(items[4]), 4000000000u);
  ASSERT_FLOAT_EQ(navigator.get_float32_value(items[5]), 1.5f);
  ASSERT_DOUBLE_EQ(navigator.get_float64_value(items[6]), 0.25);
  ASSERT_EQ(navigator.get_guid_value(items[7]).to_string(), "00112233-4455-6677-8899-aabbccddeeff");
  ASSERT_EQ(text_of(navigator.get_binary_value(items[8])), "hi");

  ASSERT_EQ(navigator.get_object_property_count(property(navigator, root, "e")), 0u);
  ASSERT_EQ(navigator.get_array_item_count(property(navigator, root, "a")), 0u);

  std::vector<JsonNavigatorNode> flags = navigator.get_array_items(property(navigator, root, "z"));
  ASSERT_EQ(flags.size(), 3u);
  ASSERT_EQ(navigator.get_node_type(flags[0]), JsonNodeType::Null);
  ASSERT_EQ(navigator.get_node_type(flags[1]), JsonNodeType::True);
  ASSERT_EQ(navigator.get_node_type(flags[2]), JsonNodeType::False);

  JsonNavigatorNode k = property(navigator, property(navigator, root, "nested"), "k");
  JsonNavigatorNode inner = navigator.get_array_item_at(k, 1);
  ASSERT_EQ(navigator.get_node_type(navigator.get_array_item_at(k, 0)), JsonNodeType::Number64);
  ASSERT_EQ(navigator.get_node_type(property(navigator, inner, "q")), JsonNodeType::Null);

  std::vector<ObjectProperty> properties = navigator.get_object_properties(root);
  ASSERT_EQ(properties.size(), 9u);
  ASSERT_EQ(navigator.get_string_value(properties[0].name_node), "id");
  ASSERT_EQ(navigator.get_string_value(properties[8].name_node), "nested");

  ASSERT_EQ(error_of([&] { navigator.get_number_value(property(navigator, root, "id")); }),
            JsonErrorCode::TypeMismatch);
  ASSERT_EQ(error_of([&] { navigator.get_array_item_count(root); }), JsonErrorCode::TypeMismatch);
  ASSERT_EQ(error_of([&] { navigator.get_object_property_count(tags); }), JsonErrorCode::TypeMismatch);
}

} // namespace

TEST(NavigatorTest, TextNavigator) {
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(bytes_of(sample_text));
  ASSERT_EQ(navigator->serialization_format(), JsonSerializationFormat::Text);
  ASSERT_EQ(navigator->get_root_node(), JsonNavigatorNode{0});
  check_sample(*navigator);
}

TEST(NavigatorTest, BinaryNavigator) {
  std::vector<std::byte> binary = to_binary(bytes_of(sample_text));
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(binary);
  ASSERT_EQ(navigator->serialization_format(), JsonSerializationFormat::Binary);
  check_sample(*navigator);
}

TEST(NavigatorTest, BinaryNavigatorWithSerializedCounts) {
  JsonWriterOptions options;
  options.serialize_count = true;
  std::vector<std::byte> binary = to_binary(bytes_of(sample_text), options);
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(binary);
  check_sample(*navigator);
}

TEST(NavigatorTest, TextNamesAreFieldNameNodes) {
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(bytes_of(R"({"k\"ey":1,"plain":2})"));
  std::vector<ObjectProperty> properties = navigator->get_object_properties(navigator->get_root_node());
  ASSERT_EQ(navigator->get_node_type(properties[0].name_node), JsonNodeType::FieldName);

  std::string_view buffered;
  ASSERT_FALSE(navigator->try_get_buffered_string_value(properties[0].name_node, buffered));
  ASSERT_EQ(navigator->get_string_value(properties[0].name_node), "k\"ey");
  ASSERT_TRUE(navigator->try_get_buffered_string_value(properties[1].name_node, buffered));
  ASSERT_EQ(buffered, "plain");

  ObjectProperty found;
  ASSERT_TRUE(navigator->try_get_object_property(navigator->get_root_node(), "k\"ey", found));
  ASSERT_EQ(navigator->get_number_value(found.value_node), Number64(1));
}

TEST(NavigatorTest, BufferedValues) {
  std::vector<std::byte> binary = to_binary(bytes_of(R"(["b\n",BaGk=])"));
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(binary);
  JsonNavigatorNode root = navigator->get_root_node();

  std::string_view text;
  ASSERT_TRUE(navigator->try_get_buffered_string_value(navigator->get_array_item_at(root, 0), text));
  ASSERT_EQ(text, "b\n");
  std::span<const std::byte> blob;
  ASSERT_TRUE(navigator->try_get_buffered_binary_value(navigator->get_array_item_at(root, 1), blob));
  ASSERT_EQ(text_of(blob), "hi");

  std::unique_ptr<IJsonNavigator> text_navigator = IJsonNavigator::create(bytes_of(R"(["b\n",BaGk=])"));
  JsonNavigatorNode text_root = text_navigator->get_root_node();
  ASSERT_FALSE(text_navigator->try_get_buffered_string_value(text_navigator->get_array_item_at(text_root, 0), text));
  ASSERT_FALSE(text_navigator->try_get_buffered_binary_value(text_navigator->get_array_item_at(text_root, 1), blob));
}

TEST(NavigatorTest, RawJsonOfNodes) {
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(bytes_of(R"( { "a" : [ 1 , 2 ] } )"));
  std::span<const std::byte> raw;
  ASSERT_TRUE(navigator->try_get_buffered_raw_json(navigator->get_root_node(), raw));
  ASSERT_EQ(text_of(raw), R"({ "a" : [ 1 , 2 ] })");

  ObjectProperty a;
  ASSERT_TRUE(navigator->try_get_object_property(navigator->get_root_node(), "a", a));
  ASSERT_TRUE(navigator->try_get_buffered_raw_json(a.value_node, raw));
  ASSERT_EQ(text_of(raw), "[ 1 , 2 ]");
}

TEST(NavigatorTest, WriteToSameFormatCopiesRaw) {
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(bytes_of(R"( { "a" : [ 1 , 2 ] } )"));

  // whitespace survives because the bytes are copied
  JsonTextWriter whole;
  navigator->write_to(navigator->get_root_node(), whole);
  ASSERT_EQ(text_of(whole.get_result()), R"({ "a" : [ 1 , 2 ] })");

  ObjectProperty a;
  ASSERT_TRUE(navigator->try_get_object_property(navigator->get_root_node(), "a", a));
  JsonTextWriter part;
  part.write_object_start();
  navigator->write_to(a.name_node, part);
  navigator->write_to(a.value_node, part);
  part.write_object_end();
  ASSERT_EQ(text_of(part.get_result()), R"({"a":[ 1 , 2 ]})");

  std::vector<std::byte> binary = to_binary(bytes_of(sample_text));
  std::unique_ptr<IJsonNavigator> binary_navigator = IJsonNavigator::create(binary);
  JsonBinaryWriter copy;
  binary_navigator->write_to(binary_navigator->get_root_node(), copy);
  ASSERT_EQ(copy_of(copy.get_result()), binary);
}

TEST(NavigatorTest, CrossFormatTranscodingIsStable) {
  std::vector<std::byte> binary = to_binary(bytes_of(sample_text));
  ASSERT_EQ(to_text(binary), sample_text);
  ASSERT_EQ(to_binary(bytes_of(to_text(binary))), binary);

  // the reader path produces the same bytes
  std::unique_ptr<IJsonReader> reader = IJsonReader::create(bytes_of(sample_text));
  JsonBinaryWriter writer;
  reader->write_all(writer);
  ASSERT_EQ(copy_of(writer.get_result()), binary);
}

TEST(NavigatorTest, DictionaryEncodedDocuments) {
  JsonStringDictionary dictionary(16);
  JsonWriterOptions options;
  options.string_dictionary = &dictionary;
  std::vector<std::byte> binary = to_binary(bytes_of(R"({"field":"field","other":[1,2]})"), options);
  ASSERT_EQ(dictionary.size(), 2u);

  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(binary, &dictionary);
  ASSERT_EQ(navigator->string_dictionary(), &dictionary);
  ASSERT_EQ(navigator->get_string_value(property(*navigator, navigator->get_root_node(), "field")), "field");
  ASSERT_EQ(to_text(binary, &dictionary), R"({"field":"field","other":[1,2]})");

  // same dictionary: raw copy
  JsonBinaryWriter same(options);
  navigator->write_to(navigator->get_root_node(), same);
  ASSERT_EQ(copy_of(same.get_result()), binary);

  // no dictionary: names are re-encoded inline
  JsonBinaryWriter plain;
  navigator->write_to(navigator->get_root_node(), plain);
  std::vector<std::byte> inline_names = copy_of(plain.get_result());
  ASSERT_NE(inline_names, binary);
  ASSERT_EQ(to_text(inline_names), R"({"field":"field","other":[1,2]})");
}

TEST(NavigatorTest, ScalarRoots) {
  std::unique_ptr<IJsonNavigator> text = IJsonNavigator::create(bytes_of(" 42 "));
  ASSERT_EQ(text->get_node_type(text->get_root_node()), JsonNodeType::Number64);
  ASSERT_EQ(text->get_number_value(text->get_root_node()), Number64(42));

  std::vector<std::byte> binary = make_bytes({0x80, 0x83, 'a', 'b', 'c'});
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(binary);
  ASSERT_EQ(navigator->get_root_node(), JsonNavigatorNode{1});
  ASSERT_EQ(navigator->get_string_value(navigator->get_root_node()), "abc");
}

TEST(NavigatorTest, CreationErrors) {
  ASSERT_EQ(error_of([] { IJsonNavigator::create(std::span<const std::byte>()); }), JsonErrorCode::InvalidArgument);
  ASSERT_EQ(error_of([] { IJsonNavigator::create(bytes_of("   ")); }), JsonErrorCode::NotComplete);
  ASSERT_EQ(error_of([] { IJsonNavigator::create(bytes_of("[1,")); }), JsonErrorCode::MissingEndArray);
  std::vector<std::byte> format_only = make_bytes({0x80});
  ASSERT_EQ(error_of([&] { IJsonNavigator::create(format_only); }), JsonErrorCode::InvalidBinaryFormat);
}

TEST(NavigatorTest, DeepSingleItemChainIsRejected) {
  std::vector<std::byte> buffer(100002, std::byte{0xE1});
  buffer.front() = std::byte{0x80};
  buffer.back() = std::byte{0x00};
  ASSERT_EQ(error_of([&] {
              std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(buffer);
              navigator->get_array_item_count(navigator->get_root_node());
            }),
            JsonErrorCode::MaxNestingExceeded);
}

TEST(NavigatorTest, UnknownHandles) {
  std::unique_ptr<IJsonNavigator> text = IJsonNavigator::create(bytes_of("[1]"));
  ASSERT_EQ(error_of([&] { text->get_node_type(JsonNavigatorNode{7}); }), JsonErrorCode::InvalidArgument);

  std::vector<std::byte> binary = make_bytes({0x80, 0x01});
  std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(binary);
  ASSERT_EQ(error_of([&] { navigator->get_node_type(JsonNavigatorNode{0}); }), JsonErrorCode::InvalidArgument);
  ASSERT_EQ(error_of([&] { navigator->get_node_type(JsonNavigatorNode{2}); }), JsonErrorCode::InvalidArgument);
}
