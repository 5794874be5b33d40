// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <any>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "yomap/node.hh"
#include "yomap/types.hh"

namespace yomap {

  // Bidirectional converter between configuration nodes and boxed values of
  // one family of types. An empty std::any stands for "no value". Both
  // directions report failures with SerializationError.
  class TypeSerializer {
  public:
    virtual ~TypeSerializer() = default;

    virtual std::any deserialize( const TypeToken& type,
      const ConfigNode& node ) const = 0;

    virtual void serialize( const TypeToken& type, const std::any& value,
      ConfigNode& node ) const = 0;
  };

  // Ordered registry of serializers. Lookups try this collection's entries
  // in registration order before falling back to the parent collection.
  class TypeSerializerCollection {
  public:
    using Predicate = std::function< bool( const TypeToken& ) >;

    explicit TypeSerializerCollection(
      std::shared_ptr< const TypeSerializerCollection > parent = nullptr )
      : parent_( std::move(parent) ) {}

    // Serializer for the given type and every subtype of it
    TypeSerializerCollection& register_type( const TypeToken& type,
      std::shared_ptr< const TypeSerializer > serializer )
    {
      return register_predicate( SuperTypePredicate(type),
        std::move(serializer) );
    }

    template < typename T >
    TypeSerializerCollection& register_type(
      std::shared_ptr< const TypeSerializer > serializer )
    {
      return register_type( type_of< T >(), std::move(serializer) );
    }

    TypeSerializerCollection& register_predicate( Predicate predicate,
      std::shared_ptr< const TypeSerializer > serializer )
    {
      entries_.push_back( { std::move(predicate), std::move(serializer) } );
      return *this;
    }

    // nullptr when no serializer accepts the type
    const TypeSerializer* resolve( const TypeToken& type ) const {
      for ( const auto& entry : entries_ ) {
        if ( entry.predicate( type ) ) return entry.serializer.get();
      }
      if ( parent_ ) return parent_->resolve( type );
      return nullptr;
    }

    const std::shared_ptr< const TypeSerializerCollection >& parent() const
      { return parent_; }

    // New empty collection that defers to this one
    static std::shared_ptr< TypeSerializerCollection > child_of(
      std::shared_ptr< const TypeSerializerCollection > parent )
    {
      return std::make_shared< TypeSerializerCollection >(
        std::move(parent) );
    }

  private:
    struct Entry {
      Predicate predicate;
      std::shared_ptr< const TypeSerializer > serializer;
    };

    std::shared_ptr< const TypeSerializerCollection > parent_;
    std::vector< Entry > entries_;
  };

} // namespace yomap
