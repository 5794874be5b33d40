#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "records.hh"

using namespace yomap_test;
using yomap::ConfigNode;
using yomap::ConfigurationOptions;
using yomap::ObjectMapper;
using yomap::YamlLoader;

TEST( YamlLoader, BlankDocumentsGiveVirtualRoots ) {
  EXPECT_TRUE( YamlLoader().load("").is_virtual() );
  EXPECT_TRUE( YamlLoader().load("  \n\n").is_virtual() );
  EXPECT_EQ( YamlLoader::to_string(YamlLoader().load("")), "" );
}

TEST( YamlLoader, ParsesMappingsInOrder ) {
  std::istringstream in( "b: 1\na: [x, y]\n" );
  ConfigNode root = YamlLoader().load( in );
  ASSERT_TRUE( root.has_map_children() );
  const auto children = root.map_children();
  ASSERT_EQ( children.size(), 2u );
  EXPECT_EQ( children[0].second.key(), "b" );
  EXPECT_EQ( children[1].second.key(), "a" );
  EXPECT_EQ( root.child("a").list_children().size(), 2u );
}

TEST( YamlLoader, ReportsParseErrors ) {
  EXPECT_THROW( YamlLoader().load("a: [1, 2\n"), std::runtime_error );
}

TEST( YamlLoader, CarriesOptionsIntoDocuments ) {
  YamlLoader loader( ConfigurationOptions::defaults().with_copy_defaults(
    true) );
  EXPECT_TRUE( loader.load("a: 1\n").options().copy_defaults );
  EXPECT_TRUE( loader.load("").options().copy_defaults );
}

TEST( YamlLoader, SavedDocumentsLoadBack ) {
  Defaults d;
  d.name = "saved";
  d.tags = { "x", "y", "z" };
  ConfigNode out = ConfigNode::root();
  ObjectMapper< Defaults >().bind( d ).serialize( out );

  std::ostringstream text;
  YamlLoader::save( out, text );
  EXPECT_FALSE( text.str().empty() );

  Defaults again;
  ObjectMapper< Defaults >().bind( again ).populate(
    YamlLoader().load(text.str()) );
  EXPECT_EQ( again.name, "saved" );
  EXPECT_EQ( again.count, 42 );
  EXPECT_EQ( again.tags, d.tags );
  EXPECT_FALSE( again.note.has_value() );
}

TEST( YamlLoader, SavedDocumentsCarryFieldComments ) {
  Defaults d;
  ConfigNode out = ConfigNode::root();
  ObjectMapper< Defaults >().bind( d ).serialize( out );
  out.child( "tags" ).child( std::size_t(1) ).set_comment( "second\ntag" );

  const std::string text = YamlLoader::to_string( out );
  EXPECT_NE( text.find("# Name used when none is configured\nname: "),
    std::string::npos );
  EXPECT_NE( text.find("  # second\n  # tag\n  - "), std::string::npos );

  Defaults again;
  again.count = 0;
  ObjectMapper< Defaults >().bind( again ).populate(
    YamlLoader().load(text) );
  EXPECT_EQ( again.name, "default" );
  EXPECT_EQ( again.count, 42 );
  EXPECT_EQ( again.tags, d.tags );
}

TEST( YamlLoader, SavedNestedDocumentsLoadBack ) {
  ConfigNode out = ConfigNode::root();
  out.child_at( { "outer", "inner key" } ).set(
    yomap::internal::make_node_from< std::int64_t >(3) );
  out.child( "outer" ).set_comment( "Outer block" );
  out.child( "empty" ).set_mapping();

  const std::string text = YamlLoader::to_string( out );
  EXPECT_NE( text.find("# Outer block\nouter:\n  \"inner key\": 3\n"),
    std::string::npos );

  ConfigNode again = YamlLoader().load( text );
  EXPECT_EQ( *again.child("outer").child("inner key").get_string(), "3" );
  EXPECT_TRUE( again.child("empty").has_map_children() );
}
