// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "yomap/errors.hh"

namespace yomap {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  class TypeSerializerCollection;
  class ObjectMapperFactory;

  // Settings shared by every node of one document
  struct ConfigurationOptions {
    std::shared_ptr< const TypeSerializerCollection > serializers;
    std::shared_ptr< ObjectMapperFactory > mapper_factory;

    // When set, populating a field whose node has no value keeps the field's
    // current value and writes it back into the node
    bool copy_defaults = false;

    // Default serializers, the shared mapper factory, copy_defaults off
    static ConfigurationOptions defaults();

    // Copy with any unset member replaced by its default
    ConfigurationOptions filled() const;

    ConfigurationOptions with_serializers(
      std::shared_ptr< const TypeSerializerCollection > s ) const
    {
      ConfigurationOptions out = *this;
      out.serializers = std::move( s );
      return out;
    }

    ConfigurationOptions with_mapper_factory(
      std::shared_ptr< ObjectMapperFactory > f ) const
    {
      ConfigurationOptions out = *this;
      out.mapper_factory = std::move( f );
      return out;
    }

    ConfigurationOptions with_copy_defaults( bool enabled ) const {
      ConfigurationOptions out = *this;
      out.copy_defaults = enabled;
      return out;
    }
  };

  // A map key or a list index
  using PathSegment = std::variant< std::string, std::size_t >;

  // Cursor into a shared YAML document. A node whose path does not exist yet
  // is virtual: reading it yields nothing, and the first write to it (or to
  // anything below it) creates the missing maps and lists along the way.
  // Copies of a ConfigNode refer to the same document.
  class ConfigNode {
  public:

    static ConfigNode root();
    static ConfigNode root( const ConfigurationOptions& options );
    static ConfigNode root( ordered_node value,
      const ConfigurationOptions& options );

    const ConfigurationOptions& options() const { return doc_->options; }

    bool is_virtual() const { return find() == nullptr; }
    // Explicit YAML null (a virtual node is not null)
    bool is_null() const;
    bool is_scalar() const;
    bool has_list_children() const;
    bool has_map_children() const;

    ConfigNode child( const std::string& key ) const;
    ConfigNode child( std::size_t index ) const;
    ConfigNode child_at( const std::vector< std::string >& keys ) const;

    // Existing children; empty when the node is not of that shape
    std::vector< ConfigNode > list_children() const;
    std::vector< std::pair< ordered_node, ConfigNode > > map_children() const;

    // Turns the node into a list if needed and returns a new last element
    ConfigNode appended_child();

    // Copy of the value at this path (null if virtual)
    ordered_node value() const;

    // Text of a scalar value; nothing for virtual, null or collection nodes
    std::optional< std::string > get_string() const;

    // Replaces the value; comments stored below this node are dropped
    void set( const ordered_node& value );
    void set_null() { set( ordered_node() ); }
    // Replace the value with an empty mapping / sequence
    void set_mapping() { set( ordered_node::mapping() ); }
    void set_sequence() { set( ordered_node::sequence() ); }

    std::optional< std::string > comment() const;
    void set_comment( const std::string& text );
    void set_comment_if_absent( const std::string& text );

    bool is_root() const { return path_.empty(); }
    // Last path segment as text ("root" for the document root)
    std::string key() const;
    // Full path, e.g., "root.sections[0].id"
    std::string path_string() const;
    const std::vector< PathSegment >& path() const { return path_; }

  private:

    struct Document {
      ordered_node root;
      bool root_virtual = true;
      std::map< std::vector< PathSegment >, std::string > comments;
      ConfigurationOptions options;
    };

    ConfigNode( std::shared_ptr< Document > doc,
      std::vector< PathSegment > path )
      : doc_( std::move(doc) ), path_( std::move(path) ) {}

    // Value at this path, or nullptr if the path does not exist
    const ordered_node* find() const;

    // Value at this path, creating it and its ancestors as needed
    ordered_node& materialize();

    std::shared_ptr< Document > doc_;
    std::vector< PathSegment > path_;
  };

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string DOC_ROOT = "root";

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string float_to_string( double value ) {
    std::ostringstream oss;
    oss.precision( std::numeric_limits< double >::digits10 );
    oss << value;
    return oss.str();
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return float_to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  inline std::string segment_string( const PathSegment& seg ) {
    if ( const auto* key = std::get_if< std::string >( &seg ) ) return *key;
    return std::to_string( std::get< std::size_t >(seg) );
  }

} // namespace yomap::internal

  // Helper for building error messages: "root.a.b[0]: message"
  [[noreturn]] inline void throw_error_at( const ConfigNode& node,
    const std::string& msg )
  {
    std::ostringstream oss;
    oss << node.path_string() << ": " << msg;
    throw SerializationError( oss.str() );
  }

} // namespace yomap

// ConfigNode member function definitions

inline yomap::ConfigNode yomap::ConfigNode::root() {
  return root( ConfigurationOptions::defaults() );
}

inline yomap::ConfigNode yomap::ConfigNode::root(
  const ConfigurationOptions& options )
{
  auto doc = std::make_shared< Document >();
  doc->options = options.filled();
  return ConfigNode( std::move(doc), {} );
}

inline yomap::ConfigNode yomap::ConfigNode::root( ordered_node value,
  const ConfigurationOptions& options )
{
  auto doc = std::make_shared< Document >();
  doc->root = std::move( value );
  doc->root_virtual = false;
  doc->options = options.filled();
  return ConfigNode( std::move(doc), {} );
}

inline const yomap::ordered_node* yomap::ConfigNode::find() const {
  if ( doc_->root_virtual ) return nullptr;

  const ordered_node* cur = &doc_->root;
  for ( const PathSegment& seg : path_ ) {
    if ( const auto* key = std::get_if< std::string >( &seg ) ) {
      if ( !cur->is_mapping() ) return nullptr;
      const ordered_node* next = nullptr;
      // Non-string keys (e.g., "1: x") are matched by their text
      for ( const auto& [mk, mv] : cur->map_items() ) {
        if ( internal::to_string_any(mk) == *key ) {
          next = &mv;
          break;
        }
      }
      if ( !next ) return nullptr;
      cur = next;
    }
    else {
      const std::size_t idx = std::get< std::size_t >( seg );
      if ( !cur->is_sequence() || idx >= cur->size() ) return nullptr;
      cur = &cur->at( idx );
    }
  }
  return cur;
}

inline yomap::ordered_node& yomap::ConfigNode::materialize() {
  if ( doc_->root_virtual ) {
    doc_->root = ordered_node();
    doc_->root_virtual = false;
  }

  ordered_node* cur = &doc_->root;
  for ( const PathSegment& seg : path_ ) {
    if ( const auto* key = std::get_if< std::string >( &seg ) ) {
      if ( !cur->is_mapping() ) *cur = ordered_node::mapping();
      auto& m = cur->get_value_ref< ordered_node::mapping_type& >();
      ordered_node* next = nullptr;
      for ( auto& kv : m ) {
        if ( internal::to_string_any(kv.first) == *key ) {
          next = &kv.second;
          break;
        }
      }
      if ( !next ) next = &( *cur )[ *key ];
      cur = next;
    }
    else {
      const std::size_t idx = std::get< std::size_t >( seg );
      if ( !cur->is_sequence() ) *cur = ordered_node::sequence();
      auto& seq = cur->get_value_ref< ordered_node::sequence_type& >();
      if ( idx >= seq.size() ) seq.resize( idx + 1 );
      cur = &seq[ idx ];
    }
  }
  return *cur;
}

inline bool yomap::ConfigNode::is_null() const {
  const ordered_node* n = find();
  return n && n->is_null();
}

inline bool yomap::ConfigNode::is_scalar() const {
  const ordered_node* n = find();
  return n && n->is_scalar() && !n->is_null();
}

inline bool yomap::ConfigNode::has_list_children() const {
  const ordered_node* n = find();
  return n && n->is_sequence();
}

inline bool yomap::ConfigNode::has_map_children() const {
  const ordered_node* n = find();
  return n && n->is_mapping();
}

inline yomap::ConfigNode yomap::ConfigNode::child(
  const std::string& key ) const
{
  std::vector< PathSegment > p = path_;
  p.emplace_back( key );
  return ConfigNode( doc_, std::move(p) );
}

inline yomap::ConfigNode yomap::ConfigNode::child( std::size_t index ) const
{
  std::vector< PathSegment > p = path_;
  p.emplace_back( index );
  return ConfigNode( doc_, std::move(p) );
}

inline yomap::ConfigNode yomap::ConfigNode::child_at(
  const std::vector< std::string >& keys ) const
{
  std::vector< PathSegment > p = path_;
  for ( const auto& k : keys ) p.emplace_back( k );
  return ConfigNode( doc_, std::move(p) );
}

inline std::vector< yomap::ConfigNode >
  yomap::ConfigNode::list_children() const
{
  std::vector< ConfigNode > out;
  const ordered_node* n = find();
  if ( !n || !n->is_sequence() ) return out;
  out.reserve( n->size() );
  for ( size_t i = 0; i < n->size(); ++i ) out.push_back( child(i) );
  return out;
}

inline std::vector< std::pair< yomap::ordered_node, yomap::ConfigNode > >
  yomap::ConfigNode::map_children() const
{
  std::vector< std::pair< ordered_node, ConfigNode > > out;
  const ordered_node* n = find();
  if ( !n || !n->is_mapping() ) return out;
  out.reserve( n->size() );
  for ( const auto& [mk, mv] : n->map_items() ) {
    out.emplace_back( mk, child(internal::to_string_any(mk)) );
  }
  return out;
}

inline yomap::ConfigNode yomap::ConfigNode::appended_child() {
  ordered_node& n = materialize();
  if ( !n.is_sequence() ) n = ordered_node::sequence();
  auto& seq = n.get_value_ref< ordered_node::sequence_type& >();
  seq.emplace_back();
  return child( seq.size() - 1 );
}

inline yomap::ordered_node yomap::ConfigNode::value() const {
  const ordered_node* n = find();
  return n ? *n : ordered_node();
}

inline std::optional< std::string > yomap::ConfigNode::get_string() const {
  const ordered_node* n = find();
  if ( !n || n->is_null() || !n->is_scalar() ) return std::nullopt;
  return internal::to_string_any( *n );
}

inline void yomap::ConfigNode::set( const ordered_node& value ) {
  // Copy first: value may alias a node inside this document
  ordered_node copy = value;
  materialize() = std::move( copy );

  // Descendant paths sort directly after path_
  auto it = doc_->comments.upper_bound( path_ );
  while ( it != doc_->comments.end() && it->first.size() > path_.size()
    && std::equal(path_.begin(), path_.end(), it->first.begin()) )
  {
    it = doc_->comments.erase( it );
  }
}

inline std::optional< std::string > yomap::ConfigNode::comment() const {
  auto it = doc_->comments.find( path_ );
  if ( it == doc_->comments.end() ) return std::nullopt;
  return it->second;
}

inline void yomap::ConfigNode::set_comment( const std::string& text ) {
  doc_->comments[ path_ ] = text;
}

inline void yomap::ConfigNode::set_comment_if_absent(
  const std::string& text )
{
  doc_->comments.emplace( path_, text );
}

inline std::string yomap::ConfigNode::key() const {
  if ( path_.empty() ) return internal::DOC_ROOT;
  return internal::segment_string( path_.back() );
}

inline std::string yomap::ConfigNode::path_string() const {
  std::string s = internal::DOC_ROOT;
  for ( const PathSegment& seg : path_ ) {
    if ( const auto* key = std::get_if< std::string >( &seg ) ) {
      s += internal::PATH_DELIMITER;
      s += *key;
    }
    else {
      s = internal::seq_indexed( s, std::get< std::size_t >(seg) );
    }
  }
  return s;
}
