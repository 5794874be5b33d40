// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <any>
#include <cctype>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>

#include "yomap/errors.hh"
#include "yomap/node.hh"
#include "yomap/object_mapper.hh"
#include "yomap/serializer.hh"
#include "yomap/types.hh"
#include "yomap/values.hh"

namespace yomap {

  // Reserved key naming the concrete type of a polymorphic record
  inline const std::string CLASS_KEY = "__class__";

namespace internal {

  inline std::string to_upper( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::toupper(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  inline std::optional< std::int64_t > parse_integer( const std::string& s ) {
    if ( s.empty() ) return std::nullopt;
    try {
      size_t pos = 0;
      const long long v = std::stoll( s, &pos, 0 );
      if ( pos != s.size() ) return std::nullopt;
      return static_cast< std::int64_t >( v );
    }
    catch ( const std::invalid_argument& ) {
      return std::nullopt;
    }
    catch ( const std::out_of_range& ) {
      return std::nullopt;
    }
  }

  inline std::optional< double > parse_float( const std::string& s ) {
    if ( s.empty() ) return std::nullopt;
    try {
      size_t pos = 0;
      const double v = std::stod( s, &pos );
      if ( pos != s.size() ) return std::nullopt;
      return v;
    }
    catch ( const std::invalid_argument& ) {
      return std::nullopt;
    }
    catch ( const std::out_of_range& ) {
      return std::nullopt;
    }
  }

  inline std::optional< bool > parse_boolean( const std::string& s ) {
    const std::string v = to_lower( s );
    if ( v == "true" || v == "yes" || v == "t" || v == "y" || v == "1" ) {
      return true;
    }
    if ( v == "false" || v == "no" || v == "f" || v == "n" || v == "0" ) {
      return false;
    }
    return std::nullopt;
  }

  inline bool is_floating( NumberKind kind ) {
    return kind == NumberKind::Float || kind == NumberKind::Double;
  }

  // Serializer registered for type, or an error naming the type
  inline const TypeSerializer& serializer_for( const ConfigNode& node,
    const TypeToken& type )
  {
    const TypeSerializer* ser = node.options().serializers->resolve( type );
    if ( !ser ) {
      throw_error_at( node, "No type serializer available for type "
        + type.name() );
    }
    return *ser;
  }

  // Text of a node holding a string-like scalar, or the "No value present"
  // error used by the parsed scalar serializers
  inline std::string required_string( const ConfigNode& node ) {
    std::optional< std::string > s = node.get_string();
    if ( !s ) {
      throw SerializationError( "No value present in node "
        + node.path_string() );
    }
    return *s;
  }

} // namespace yomap::internal

  class StringSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  class BooleanSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  // Every arithmetic type; the token's NumberKind selects the read
  class NumberSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  // Enum constants by declared name; input is matched in upper case
  class EnumValueSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  class UuidSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  class UriSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  class UrlSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  class PatternSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  // std::vector< E >. A single non-list value reads as a one-element list.
  class ListSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  // std::map< K, V > and ordered_map< K, V >. Keys are converted with the
  // key type's serializer applied to a detached node holding the raw key.
  class MapSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  // Records, through the mapper factory of the node's document. Abstract
  // declared types are resolved through the CLASS_KEY tag.
  class RecordSerializer : public TypeSerializer {
  public:
    std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const override;
    void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const override;
  };

  class TypeSerializers {
  public:
    // Shared, immutable collection of the built-in serializers. Extend it
    // with TypeSerializerCollection::child_of( TypeSerializers::defaults() ).
    static std::shared_ptr< const TypeSerializerCollection > defaults();
  };

} // namespace yomap

// StringSerializer

inline std::any yomap::StringSerializer::deserialize( const TypeToken&,
  const ConfigNode& node ) const
{
  if ( node.is_virtual() || node.is_null() ) return std::any();
  std::optional< std::string > s = node.get_string();
  if ( !s ) throw_error_at( node, "Expected a scalar value for type string" );
  return std::any( *s );
}

inline void yomap::StringSerializer::serialize( const TypeToken&,
  const std::any& value, ConfigNode& node ) const
{
  node.set( internal::make_node_from(
    std::any_cast< const std::string& >(value)) );
}

// BooleanSerializer

inline std::any yomap::BooleanSerializer::deserialize( const TypeToken&,
  const ConfigNode& node ) const
{
  if ( node.is_virtual() || node.is_null() ) return std::any();

  const ordered_node n = node.value();
  if ( n.is_boolean() ) return std::any( n.get_value< bool >() );
  if ( n.is_integer() ) {
    return std::any( internal::to_native_checked< std::int64_t >(n) != 0 );
  }
  if ( n.is_string() ) {
    const std::string s = internal::to_native_checked< std::string >( n );
    if ( auto b = internal::parse_boolean(s) ) return std::any( *b );
    throw_error_at( node, "Value is not a boolean: " + s );
  }
  throw_error_at( node, "Value is not a boolean: "
    + internal::to_string_any(n) );
}

inline void yomap::BooleanSerializer::serialize( const TypeToken&,
  const std::any& value, ConfigNode& node ) const
{
  node.set( internal::make_node_from(std::any_cast< bool >(value)) );
}

// NumberSerializer

inline std::any yomap::NumberSerializer::deserialize( const TypeToken& type,
  const ConfigNode& node ) const
{
  if ( node.is_virtual() || node.is_null() ) return std::any();

  const NumberOps& ops = *type.info().number;
  const ordered_node n = node.value();

  // Floats reach integer kinds truncated toward zero
  std::any out;
  if ( n.is_integer() ) {
    const std::int64_t i = internal::to_native_checked< std::int64_t >( n );
    out = internal::is_floating( type.number_kind() )
      ? ops.from_float( static_cast< double >(i) ) : ops.from_integer( i );
  }
  else if ( n.is_float_number() ) {
    out = ops.from_float( internal::to_native_checked< double >(n) );
  }
  else if ( n.is_string() ) {
    const std::string s = internal::to_native_checked< std::string >( n );
    std::optional< std::int64_t > i;
    if ( !internal::is_floating(type.number_kind()) ) {
      i = internal::parse_integer( s );
    }
    if ( i ) out = ops.from_integer( *i );
    else if ( auto d = internal::parse_float(s) ) out = ops.from_float( *d );
  }
  if ( out.has_value() ) return out;

  throw_error_at( node, "Value is not a valid " + type.name() + ": "
    + internal::to_string_any(n) );
}

inline void yomap::NumberSerializer::serialize( const TypeToken& type,
  const std::any& value, ConfigNode& node ) const
{
  const NumberOps& ops = *type.info().number;
  if ( internal::is_floating(type.number_kind()) ) {
    node.set( internal::make_node_from(ops.to_float(value)) );
  }
  else {
    node.set( internal::make_node_from(ops.to_integer(value)) );
  }
}

// EnumValueSerializer

inline std::any yomap::EnumValueSerializer::deserialize(
  const TypeToken& type, const ConfigNode& node ) const
{
  const std::string constant = internal::to_upper(
    internal::required_string(node) );

  std::any value = type.info().enumeration->value_of( constant );
  if ( !value.has_value() ) {
    throw SerializationError( "Invalid enum constant provided for "
      + node.key() + ": Expected a value of enum " + type.name() + ", got "
      + constant );
  }
  return value;
}

inline void yomap::EnumValueSerializer::serialize( const TypeToken& type,
  const std::any& value, ConfigNode& node ) const
{
  std::optional< std::string > name = type.info().enumeration->name_of(
    value );
  if ( !name ) {
    throw_error_at( node, "Value is not a declared constant of enum "
      + type.name() );
  }
  node.set( internal::make_node_from(*name) );
}

// UuidSerializer

inline std::any yomap::UuidSerializer::deserialize( const TypeToken&,
  const ConfigNode& node ) const
{
  const std::string s = internal::required_string( node );
  try {
    return std::any( Uuid::parse(s) );
  }
  catch ( const std::invalid_argument& ) {
    std::throw_with_nested( SerializationError(node.path_string()
      + ": Value not a UUID: " + s) );
  }
}

inline void yomap::UuidSerializer::serialize( const TypeToken&,
  const std::any& value, ConfigNode& node ) const
{
  node.set( internal::make_node_from(
    std::any_cast< const Uuid& >(value).to_string()) );
}

// UriSerializer

inline std::any yomap::UriSerializer::deserialize( const TypeToken&,
  const ConfigNode& node ) const
{
  const std::string s = internal::required_string( node );
  try {
    return std::any( Uri::parse(s) );
  }
  catch ( const std::invalid_argument& ) {
    std::throw_with_nested( SerializationError(
      "Invalid URI string provided for " + node.key() + ": got " + s) );
  }
}

inline void yomap::UriSerializer::serialize( const TypeToken&,
  const std::any& value, ConfigNode& node ) const
{
  node.set( internal::make_node_from(
    std::any_cast< const Uri& >(value).to_string()) );
}

// UrlSerializer

inline std::any yomap::UrlSerializer::deserialize( const TypeToken&,
  const ConfigNode& node ) const
{
  const std::string s = internal::required_string( node );
  try {
    return std::any( Url::parse(s) );
  }
  catch ( const std::invalid_argument& ) {
    std::throw_with_nested( SerializationError(
      "Invalid URL string provided for " + node.key() + ": got " + s) );
  }
}

inline void yomap::UrlSerializer::serialize( const TypeToken&,
  const std::any& value, ConfigNode& node ) const
{
  node.set( internal::make_node_from(
    std::any_cast< const Url& >(value).to_string()) );
}

// PatternSerializer

inline std::any yomap::PatternSerializer::deserialize( const TypeToken&,
  const ConfigNode& node ) const
{
  const std::string s = internal::required_string( node );
  try {
    return std::any( Pattern(s) );
  }
  catch ( const std::regex_error& ) {
    std::throw_with_nested( SerializationError(
      "Invalid pattern provided for " + node.key() + ": got " + s) );
  }
}

inline void yomap::PatternSerializer::serialize( const TypeToken&,
  const std::any& value, ConfigNode& node ) const
{
  node.set( internal::make_node_from(
    std::any_cast< const Pattern& >(value).pattern()) );
}

// ListSerializer

inline std::any yomap::ListSerializer::deserialize( const TypeToken& type,
  const ConfigNode& node ) const
{
  const TypeToken element = type.parameter( 0 );
  const TypeSerializer& ser = internal::serializer_for( node, element );
  const ListOps& ops = *type.info().list;

  std::any out = ops.make();
  if ( node.has_list_children() ) {
    for ( const ConfigNode& child : node.list_children() ) {
      ops.append( out, ser.deserialize(element, child) );
    }
  }
  else if ( !node.is_virtual() && !node.is_null() ) {
    ops.append( out, ser.deserialize(element, node) );
  }
  return out;
}

inline void yomap::ListSerializer::serialize( const TypeToken& type,
  const std::any& value, ConfigNode& node ) const
{
  const TypeToken element = type.parameter( 0 );
  const TypeSerializer& ser = internal::serializer_for( node, element );

  node.set_sequence();
  for ( const std::any& e : type.info().list->elements(value) ) {
    ConfigNode child = node.appended_child();
    if ( !e.has_value() ) child.set_null();
    else ser.serialize( element, e, child );
  }
}

// MapSerializer

inline std::any yomap::MapSerializer::deserialize( const TypeToken& type,
  const ConfigNode& node ) const
{
  const MapOps& ops = *type.info().map;
  std::any out = ops.make();
  if ( !node.has_map_children() ) return out;

  const TypeToken key_type = type.parameter( 0 );
  const TypeToken value_type = type.parameter( 1 );
  const TypeSerializer& key_ser = internal::serializer_for( node, key_type );
  const TypeSerializer& value_ser = internal::serializer_for( node,
    value_type );

  for ( const auto& [raw_key, child] : node.map_children() ) {
    const ConfigNode key_node = ConfigNode::root( raw_key, node.options() );
    std::any key = key_ser.deserialize( key_type, key_node );
    std::any value = value_ser.deserialize( value_type, child );
    if ( !key.has_value() || !value.has_value() ) continue;
    ops.put( out, std::move(key), std::move(value) );
  }
  return out;
}

inline void yomap::MapSerializer::serialize( const TypeToken& type,
  const std::any& value, ConfigNode& node ) const
{
  const TypeToken key_type = type.parameter( 0 );
  const TypeToken value_type = type.parameter( 1 );
  const TypeSerializer& key_ser = internal::serializer_for( node, key_type );
  const TypeSerializer& value_ser = internal::serializer_for( node,
    value_type );

  node.set_mapping();
  for ( const auto& [key, v] : type.info().map->entries(value) ) {
    if ( !key.has_value() ) continue;
    ConfigNode key_node = ConfigNode::root( node.options() );
    key_ser.serialize( key_type, key, key_node );
    std::optional< std::string > wire = key_node.get_string();
    if ( !wire ) {
      throw_error_at( node, "Map key of type " + key_type.name()
        + " has no scalar form" );
    }

    ConfigNode child = node.child( *wire );
    if ( !v.has_value() ) child.set_null();
    else value_ser.serialize( value_type, v, child );
  }
}

// RecordSerializer

inline std::any yomap::RecordSerializer::deserialize( const TypeToken& type,
  const ConfigNode& node ) const
{
  if ( node.is_virtual() || node.is_null() ) return std::any();
  ObjectMapperFactory& factory = *node.options().mapper_factory;

  std::optional< SubtypeEntry > subtype;
  if ( type.is_abstract() ) {
    std::optional< std::string > tag = node.child( CLASS_KEY ).get_string();
    if ( !tag ) {
      throw_error_at( node, "No available configured type for instances of "
        + type.name() );
    }
    subtype = factory.find_subtype( type, *tag );
    if ( !subtype ) throw_error_at( node, "Unknown class of object " + *tag );
  }

  const TypeToken target = subtype ? subtype->type : type;
  auto mapper = factory.get_mapper( target );
  std::any instance = mapper->create_instance();
  mapper->populate_instance( target.info().record->address(instance), node );

  if ( subtype ) return subtype->upcast( instance );
  return instance;
}

inline void yomap::RecordSerializer::serialize( const TypeToken& type,
  const std::any& value, ConfigNode& node ) const
{
  ObjectMapperFactory& factory = *node.options().mapper_factory;
  const RecordOps& ops = *type.info().record;

  void* address = ops.address( value );
  if ( !address ) {
    node.set_null();
    return;
  }

  // A registered subtype is serialized with its own fields
  const std::type_index runtime = ops.runtime_type( value );
  std::optional< SubtypeEntry > subtype;
  if ( runtime != type.raw() ) subtype = factory.find_subtype( type, runtime );

  if ( type.is_abstract() && !subtype ) {
    throw_error_at( node, "Unknown class of object "
      + internal::demangle(runtime.name()) );
  }

  if ( !node.has_map_children() ) node.set_mapping();
  if ( type.is_abstract() ) {
    node.child( CLASS_KEY ).set( internal::make_node_from(subtype->tag) );
  }

  const TypeToken target = subtype ? subtype->type : type;
  const void* instance = subtype ? subtype->downcast( address ) : address;
  factory.get_mapper( target )->serialize_instance( instance, node );
}

// TypeSerializers

inline std::shared_ptr< const yomap::TypeSerializerCollection >
  yomap::TypeSerializers::defaults()
{
  static const std::shared_ptr< const TypeSerializerCollection > collection
    = [] {
      auto c = std::make_shared< TypeSerializerCollection >();
      c->register_type< Uri >( std::make_shared< UriSerializer >() );
      c->register_type< Url >( std::make_shared< UrlSerializer >() );
      c->register_type< Uuid >( std::make_shared< UuidSerializer >() );
      c->register_predicate( []( const TypeToken& t ) {
        return t.kind() == TypeKind::Record;
      }, std::make_shared< RecordSerializer >() );
      c->register_type( types::any_number(),
        std::make_shared< NumberSerializer >() );
      c->register_type< std::string >( std::make_shared< StringSerializer >() );
      c->register_type< bool >( std::make_shared< BooleanSerializer >() );
      c->register_type( types::any_map(), std::make_shared< MapSerializer >() );
      c->register_type( types::any_list(),
        std::make_shared< ListSerializer >() );
      c->register_type( types::any_enum(),
        std::make_shared< EnumValueSerializer >() );
      c->register_type< Pattern >( std::make_shared< PatternSerializer >() );
      return std::shared_ptr< const TypeSerializerCollection >( c );
    }();
  return collection;
}

// ConfigurationOptions

inline yomap::ConfigurationOptions yomap::ConfigurationOptions::defaults() {
  ConfigurationOptions options;
  options.serializers = TypeSerializers::defaults();
  options.mapper_factory = ObjectMapperFactory::instance();
  options.copy_defaults = false;
  return options;
}

inline yomap::ConfigurationOptions
  yomap::ConfigurationOptions::filled() const
{
  ConfigurationOptions out = *this;
  if ( !out.serializers ) out.serializers = TypeSerializers::defaults();
  if ( !out.mapper_factory ) {
    out.mapper_factory = ObjectMapperFactory::instance();
  }
  return out;
}
