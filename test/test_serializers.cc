#include <any>
#include <cmath>
#include <cstdint>
#include <exception>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "records.hh"

using namespace yomap_test;
using yomap::ConfigNode;
using yomap::SerializationError;
using yomap::TypeSerializer;
using yomap::TypeSerializerCollection;
using yomap::TypeToken;
using yomap::type_of;

namespace {

  // Node "root.v" of a document holding "v: <yaml>"
  ConfigNode value_node( const std::string& yaml ) {
    return yomap::YamlLoader().load( "v: " + yaml + "\n" ).child( "v" );
  }

  template < typename T >
  std::any read_any( const std::string& yaml ) {
    const ConfigNode node = value_node( yaml );
    const TypeToken type = yomap::ValueTraits< T >::token();
    const TypeSerializer* ser = node.options().serializers->resolve( type );
    if ( !ser ) throw std::logic_error( "no serializer for " + type.name() );
    return ser->deserialize( type, node );
  }

  template < typename T >
  T read( const std::string& yaml ) {
    return std::any_cast< T >( read_any< T >(yaml) );
  }

  template < typename T >
  ConfigNode write( const T& value ) {
    ConfigNode node = ConfigNode::root().child( "v" );
    const TypeToken type = yomap::ValueTraits< T >::token();
    node.options().serializers->resolve( type )->serialize( type,
      yomap::ValueTraits< T >::box(value), node );
    return node;
  }

  std::string message_of( const std::exception& e ) { return e.what(); }

  class ShoutingStringSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken&,
      const ConfigNode& node ) const override
    {
      return std::any( yomap::internal::to_upper(*node.get_string()) );
    }

    void serialize( const TypeToken&, const std::any& value,
      ConfigNode& node ) const override
    {
      node.set( yomap::internal::make_node_from(yomap::internal::to_upper(
        std::any_cast< const std::string& >(value))) );
    }
  };

} // anonymous namespace

TEST( StringSerializer, ReadsScalarText ) {
  EXPECT_EQ( read< std::string >("hello"), "hello" );
  EXPECT_EQ( read< std::string >("12"), "12" );
  EXPECT_FALSE( read_any< std::string >("~").has_value() );
  EXPECT_THROW( read< std::string >("[1, 2]"), SerializationError );
}

TEST( BooleanSerializer, CoercesCommonSpellings ) {
  EXPECT_TRUE( read< bool >("true") );
  EXPECT_TRUE( read< bool >("\"Yes\"") );
  EXPECT_TRUE( read< bool >("1") );
  EXPECT_FALSE( read< bool >("0") );
  EXPECT_FALSE( read< bool >("\"N\"") );
  EXPECT_FALSE( read_any< bool >("~").has_value() );
  EXPECT_THROW( read< bool >("maybe"), SerializationError );
}

TEST( NumberSerializer, FollowsDeclaredWidth ) {
  EXPECT_EQ( read< int >("42"), 42 );
  EXPECT_EQ( read< int >("\"42\""), 42 );
  EXPECT_EQ( read< int >("2.9"), 2 );
  EXPECT_EQ( read< std::int64_t >("5000000000"), 5000000000LL );
  EXPECT_DOUBLE_EQ( read< double >("3"), 3.0 );
  EXPECT_FLOAT_EQ( read< float >("1.25"), 1.25f );
  EXPECT_FALSE( read_any< int >("~").has_value() );
  EXPECT_THROW( read< int >("abc"), SerializationError );
}

TEST( NumberSerializer, TruncatesNarrowIntegers ) {
  EXPECT_EQ( read< short >("70000"), static_cast< short >(70000) );
  EXPECT_EQ( read< std::int8_t >("300"), static_cast< std::int8_t >(300) );
}

TEST( NumberSerializer, RejectsFloatsOutsideTheDeclaredRange ) {
  EXPECT_THROW( read< int >("1e30"), SerializationError );
  EXPECT_THROW( read< int >("\"1e30\""), SerializationError );
  EXPECT_THROW( read< int >(".nan"), SerializationError );
  EXPECT_THROW( read< std::int64_t >("-1e19"), SerializationError );
  EXPECT_THROW( read< unsigned short >("-1.5"), SerializationError );
  EXPECT_THROW( read< float >("1e300"), SerializationError );
  EXPECT_EQ( read< std::int8_t >("-128.7"), -128 );
  EXPECT_EQ( read< unsigned short >("-0.5"), 0 );
  EXPECT_DOUBLE_EQ( read< double >("1e300"), 1e300 );
  EXPECT_TRUE( std::isnan(read< double >(".nan")) );
}

TEST( NumberSerializer, WritesIntegerOrFloatScalars ) {
  const ConfigNode i = write< short >( 5 );
  EXPECT_TRUE( i.value().is_integer() );
  EXPECT_EQ( i.value().get_value< std::int64_t >(), 5 );

  const ConfigNode d = write< double >( 1.5 );
  EXPECT_TRUE( d.value().is_float_number() );
  EXPECT_DOUBLE_EQ( d.value().get_value< double >(), 1.5 );
}

TEST( EnumValueSerializer, IgnoresInputCase ) {
  EXPECT_EQ( read< Color >("red"), Color::RED );
  EXPECT_EQ( read< Color >("RED"), Color::RED );
  EXPECT_EQ( read< Color >("Green"), Color::GREEN );
  EXPECT_EQ( *write< Color >(Color::BLUE).get_string(), "BLUE" );
}

TEST( EnumValueSerializer, RejectsUnknownConstants ) {
  try {
    read< Color >( "purple" );
    FAIL() << "expected a SerializationError";
  }
  catch ( const SerializationError& e ) {
    EXPECT_EQ( message_of(e), "Invalid enum constant provided for v: "
      "Expected a value of enum yomap_test::Color, got PURPLE" );
  }
  EXPECT_THROW( read< Color >("~"), SerializationError );
}

TEST( UuidSerializer, NestsParseFailure ) {
  const yomap::Uuid id = read< yomap::Uuid >(
    "\"123E4567-E89B-12D3-A456-426614174000\"" );
  EXPECT_EQ( id.to_string(), "123e4567-e89b-12d3-a456-426614174000" );

  try {
    read< yomap::Uuid >( "nope" );
    FAIL() << "expected a SerializationError";
  }
  catch ( const SerializationError& e ) {
    EXPECT_NE( message_of(e).find("Value not a UUID"), std::string::npos );
    EXPECT_THROW( std::rethrow_if_nested(e), std::invalid_argument );
  }

  try {
    read< yomap::Uuid >( "~" );
    FAIL() << "expected a SerializationError";
  }
  catch ( const SerializationError& e ) {
    EXPECT_EQ( message_of(e), "No value present in node root.v" );
  }
}

TEST( UriAndUrlSerializers, ParseAndNestFailures ) {
  EXPECT_EQ( read< yomap::Uri >("\"../a/b\"").path(), "../a/b" );
  EXPECT_EQ( read< yomap::Url >("\"https://example.org/x\"").protocol(),
    "https" );
  EXPECT_EQ( *write< yomap::Url >(yomap::Url::parse("ftp://host/f"))
    .get_string(), "ftp://host/f" );

  try {
    read< yomap::Url >( "\"gopher://example.org\"" );
    FAIL() << "expected a SerializationError";
  }
  catch ( const SerializationError& e ) {
    EXPECT_NE( message_of(e).find("Invalid URL string provided for v"),
      std::string::npos );
    EXPECT_THROW( std::rethrow_if_nested(e), std::invalid_argument );
  }

  EXPECT_THROW( read< yomap::Uri >("\"a b\""), SerializationError );
}

TEST( PatternSerializer, CompilesAndNestsFailures ) {
  const yomap::Pattern p = read< yomap::Pattern >( "\"^a+$\"" );
  EXPECT_TRUE( p.matches("aaa") );
  EXPECT_EQ( *write< yomap::Pattern >(p).get_string(), "^a+$" );

  try {
    read< yomap::Pattern >( "\"(unclosed\"" );
    FAIL() << "expected a SerializationError";
  }
  catch ( const SerializationError& e ) {
    EXPECT_THROW( std::rethrow_if_nested(e), std::regex_error );
  }
}

TEST( ListSerializer, ReadsListsAndWrapsScalars ) {
  EXPECT_EQ( read< std::vector< int > >("[1, 2, 3]"),
    ( std::vector< int >{ 1, 2, 3 } ) );
  EXPECT_EQ( read< std::vector< int > >("5"), std::vector< int >{ 5 } );
  EXPECT_TRUE( read< std::vector< int > >("~").empty() );
  EXPECT_EQ( read< std::vector< Color > >("[red, blue]"),
    ( std::vector< Color >{ Color::RED, Color::BLUE } ) );
}

TEST( ListSerializer, WritesOneChildPerElement ) {
  const ConfigNode node = write< std::vector< std::string > >( { "a", "b" } );
  ASSERT_TRUE( node.has_list_children() );
  const auto children = node.list_children();
  ASSERT_EQ( children.size(), 2u );
  EXPECT_EQ( *children[0].get_string(), "a" );
  EXPECT_EQ( *children[1].get_string(), "b" );

  const ConfigNode empty = write< std::vector< int > >( {} );
  EXPECT_FALSE( empty.is_virtual() );
  EXPECT_TRUE( empty.list_children().empty() );
}

TEST( MapSerializer, PreservesSourceOrder ) {
  const auto m = read< yomap::ordered_map< std::string, int > >(
    "{b: 2, a: 1, c: 3}" );
  ASSERT_EQ( m.size(), 3u );
  auto it = m.begin();
  EXPECT_EQ( it->first, "b" );
  EXPECT_EQ( ( ++it )->first, "a" );
  EXPECT_EQ( ( ++it )->first, "c" );
}

TEST( MapSerializer, SkipsNullEntriesAndConvertsKeys ) {
  const auto m = read< yomap::ordered_map< std::string, int > >(
    "{a: 1, b: ~}" );
  ASSERT_EQ( m.size(), 1u );
  EXPECT_EQ( m.begin()->first, "a" );

  const auto by_color = read< std::map< Color, int > >( "{red: 1, GREEN: 2}" );
  ASSERT_EQ( by_color.size(), 2u );
  EXPECT_EQ( by_color.at(Color::RED), 1 );
  EXPECT_EQ( by_color.at(Color::GREEN), 2 );

  EXPECT_TRUE( ( read< std::map< std::string, int > >("[1, 2]").empty() ) );
}

TEST( MapSerializer, WritesKeysThroughKeySerializer ) {
  std::map< Color, int > m { { Color::RED, 1 }, { Color::BLUE, 3 } };
  const ConfigNode node = write( m );
  ASSERT_TRUE( node.has_map_children() );
  EXPECT_EQ( *node.child("RED").get_string(), "1" );
  EXPECT_EQ( *node.child("BLUE").get_string(), "3" );
}

TEST( TypeSerializerCollection, ChildEntriesWinOverParent ) {
  const auto defaults = yomap::TypeSerializers::defaults();
  auto child = TypeSerializerCollection::child_of( defaults );
  auto shouting = std::make_shared< ShoutingStringSerializer >();
  child->register_type< std::string >( shouting );

  EXPECT_EQ( child->resolve(type_of< std::string >()), shouting.get() );
  EXPECT_EQ( child->resolve(type_of< int >()),
    defaults->resolve(type_of< int >()) );
  EXPECT_NE( defaults->resolve(type_of< std::string >()), shouting.get() );

  TypeSerializerCollection empty;
  EXPECT_EQ( empty.resolve(type_of< std::string >()), nullptr );
}

TEST( TypeSerializerCollection, EarlierRegistrationsWin ) {
  TypeSerializerCollection c;
  auto first = std::make_shared< ShoutingStringSerializer >();
  auto second = std::make_shared< ShoutingStringSerializer >();
  c.register_predicate( []( const TypeToken& t ) {
    return t.kind() == yomap::TypeKind::Scalar;
  }, first );
  c.register_type< std::string >( second );
  EXPECT_EQ( c.resolve(type_of< std::string >()), first.get() );
}

TEST( TypeSerializerCollection, CustomSerializersReachFields ) {
  auto child = TypeSerializerCollection::child_of(
    yomap::TypeSerializers::defaults() );
  child->register_type< std::string >(
    std::make_shared< ShoutingStringSerializer >() );

  ConfigNode root = yomap::YamlLoader(
    yomap::ConfigurationOptions::defaults().with_serializers(child) ).load(
    "item-name: quiet\n" );
  Named named;
  yomap::ObjectMapper< Named >().bind( named ).populate( root );
  EXPECT_EQ( named.item_name, "QUIET" );
}
