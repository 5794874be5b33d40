// ╻ ╻┏━┓┏┳┓┏━┓┏━┓
// ┗┳┛┃ ┃┃┃┃┣━┫┣━┛
//  ╹ ┗━┛╹ ╹╹ ╹╹
//  YAML Object Mapping
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <any>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "yomap/errors.hh"
#include "yomap/node.hh"
#include "yomap/serializer.hh"
#include "yomap/types.hh"

namespace yomap {

  // One mapped data member of a record, reachable through type-erased
  // accessors on a void pointer to the record
  class FieldData {
  public:
    using Getter = std::function< std::any( const void* ) >;
    using Setter = std::function< void( void*, std::any ) >;

    FieldData( std::string identifier, std::string comment, TypeToken type,
      Getter getter, Setter setter )
      : identifier_( std::move(identifier) ), comment_( std::move(comment) ),
      type_( type ), getter_( std::move(getter) ),
      setter_( std::move(setter) ) {}

    const std::string& identifier() const { return identifier_; }
    const std::string& comment() const { return comment_; }
    const TypeToken& type() const { return type_; }

    std::any get( const void* instance ) const { return getter_( instance ); }
    void set( void* instance, std::any value ) const;

    // Reads the field from its node (see ObjectMapperBase::populate_instance)
    void deserialize_from( void* instance, const ConfigNode& node ) const;

    // Writes the field into its node
    void serialize_to( const void* instance, ConfigNode& node ) const;

    // Same field accessed through a pointer to a derived record
    FieldData rebased( void* (*upcast)( void* ) ) const;

  private:
    const TypeSerializer& serializer_for( const ConfigNode& node ) const;

    std::string identifier_;
    std::string comment_;
    TypeToken type_;
    Getter getter_;
    Setter setter_;
  };

  // Declaration of one field inside map_fields
  class FieldSpec {
  public:
    // Wire key to use instead of the field identifier
    FieldSpec& path( const std::string& p ) {
      path_ = p;
      return *this;
    }

    FieldSpec& comment( const std::string& c ) {
      comment_ = c;
      return *this;
    }

  private:
    template < typename > friend class RecordBuilder;

    FieldSpec( std::string identifier, TypeToken (*token)(),
      FieldData::Getter getter, FieldData::Setter setter )
      : identifier_( std::move(identifier) ), token_( token ),
      getter_( std::move(getter) ), setter_( std::move(setter) ) {}

    std::string identifier_;
    std::string path_;
    std::string comment_;
    TypeToken (*token_)();
    FieldData::Getter getter_;
    FieldData::Setter setter_;
  };

  // Collects the mapped fields and bases a record declares in its static
  // map_fields( RecordBuilder< T >& ) function
  template < typename T >
  class RecordBuilder {
  public:
    using FieldList = std::vector< std::pair< std::string, FieldData > >;

    template < typename M, typename C >
    FieldSpec& field( const std::string& identifier, M C::* member );

    // Map the fields of a base record as well. Bases are visited in the
    // order they are declared, after the fields of this record.
    template < typename Base >
    RecordBuilder& inherit();

    // (wire path, field) pairs: own fields, then each base's fields
    FieldList collect() const;

    std::vector< TypeToken > supertypes() const;

  private:
    struct BaseEntry {
      TypeToken (*token)();
      FieldList (*collect)();
      void* (*upcast)( void* );
    };

    // deque keeps returned FieldSpec references valid
    std::deque< FieldSpec > fields_;
    std::vector< BaseEntry > bases_;
  };

  class ObjectMapperBase {
  public:
    // Wire path -> field, in lookup order
    using FieldTable = fkyaml::ordered_map< std::string, FieldData >;
    using Constructor = std::shared_ptr< void > (*)();

    virtual ~ObjectMapperBase() = default;

    const TypeToken& mapped_type() const { return type_; }
    bool can_create_instances() const { return constructor_ != nullptr; }
    const FieldTable& fields() const { return fields_; }

    // New default-constructed instance, boxed as std::shared_ptr< T >
    std::any create_instance() const;

    // instance must point to an object of exactly the mapped type
    void populate_instance( void* instance, const ConfigNode& source ) const;
    void serialize_instance( const void* instance, ConfigNode& target ) const;

  protected:
    ObjectMapperBase( TypeToken type, Constructor constructor,
      std::vector< std::pair< std::string, FieldData > > fields );

  private:
    TypeToken type_;
    Constructor constructor_;
    FieldTable fields_;
  };

  template < typename T >
  class ObjectMapper : public ObjectMapperBase {
  public:
    ObjectMapper();

    // An ObjectMapper paired with one record instance
    class BoundInstance {
    public:
      // Deserialize the record's fields from source
      void populate( const ConfigNode& source ) {
        mapper_->populate_instance( instance_.get(), source );
      }

      // Serialize the record's fields into target
      void serialize( ConfigNode& target ) const {
        mapper_->serialize_instance( instance_.get(), target );
      }

      T& instance() const { return *instance_; }
      const std::shared_ptr< T >& shared_instance() const
        { return instance_; }

    private:
      friend class ObjectMapper;

      BoundInstance( const ObjectMapper* mapper, std::shared_ptr< T > inst )
        : mapper_( mapper ), instance_( std::move(inst) ) {}

      const ObjectMapper* mapper_;
      std::shared_ptr< T > instance_;
    };

    // The caller keeps both the mapper and instance alive while bound
    BoundInstance bind( T& instance ) const {
      return BoundInstance( this,
        std::shared_ptr< T >( std::shared_ptr< T >(), &instance ) );
    }

    BoundInstance bind_to_new() const {
      return BoundInstance( this,
        std::any_cast< std::shared_ptr< T > >( create_instance() ) );
    }

    // Shared mapper from the process-wide factory
    static std::shared_ptr< const ObjectMapper > for_type();
  };

  // A concrete record registered under a tag for an abstract (or
  // polymorphic) base
  struct SubtypeEntry {
    std::string tag;
    TypeToken type;
    // Boxed std::shared_ptr< Derived > -> boxed std::shared_ptr< Base >
    std::any (*upcast)( const std::any& derived );
    // Base* -> Derived*
    void* (*downcast)( void* base );
  };

  // Thread-safe cache of mappers keyed by type, plus the subtype tag table
  class ObjectMapperFactory {
  public:
    ObjectMapperFactory() = default;
    ObjectMapperFactory( const ObjectMapperFactory& ) = delete;
    ObjectMapperFactory& operator=( const ObjectMapperFactory& ) = delete;

    // Process-wide default factory
    static std::shared_ptr< ObjectMapperFactory > instance();

    std::shared_ptr< const ObjectMapperBase > get_mapper(
      const TypeToken& type );

    template < typename T >
    std::shared_ptr< const ObjectMapper< T > > get_mapper() {
      return std::static_pointer_cast< const ObjectMapper< T > >(
        get_mapper(type_of< T >()) );
    }

    // Map tag to Derived when a Base is expected. The default tag is the
    // demangled C++ name of Derived.
    template < typename Base, typename Derived >
    void register_subtype( const std::string& tag );

    template < typename Base, typename Derived >
    void register_subtype() {
      register_subtype< Base, Derived >( internal::type_name< Derived >() );
    }

    std::optional< SubtypeEntry > find_subtype( const TypeToken& base,
      const std::string& tag ) const;

    // First registration under base whose type is runtime
    std::optional< SubtypeEntry > find_subtype( const TypeToken& base,
      std::type_index runtime ) const;

  private:
    void add_subtype( const TypeToken& base, SubtypeEntry entry );

    mutable std::mutex mutex_;
    std::unordered_map< std::type_index,
      std::shared_ptr< const ObjectMapperBase > > mappers_;
    std::vector< std::pair< std::type_index, SubtypeEntry > > subtypes_;
  };

namespace internal {

  template < typename T >
  std::vector< TypeToken > record_supertypes() {
    static const std::vector< TypeToken > bases = [] {
      RecordBuilder< T > builder;
      T::map_fields( builder );
      return builder.supertypes();
    }();
    return bases;
  }

  template < typename T >
  typename RecordBuilder< T >::FieldList record_fields() {
    RecordBuilder< T > builder;
    T::map_fields( builder );
    return builder.collect();
  }

  template < typename T >
  ObjectMapperBase::Constructor constructor_for() {
    if constexpr ( std::is_default_constructible_v< T >
      && !std::is_abstract_v< T > )
    {
      return []() -> std::shared_ptr< void > {
        return std::make_shared< T >();
      };
    }
    else {
      return nullptr;
    }
  }

  template < typename T >
  const RecordOps& record_ops() {
    static const RecordOps ops {
      &record_supertypes< T >,
      []() -> std::shared_ptr< const ObjectMapperBase > {
        return std::make_shared< const ObjectMapper< T > >();
      },
      []( std::shared_ptr< void > instance ) -> std::any {
        return std::any( std::static_pointer_cast< T >(instance) );
      },
      []( const std::any& value ) -> void* {
        const auto& p = std::any_cast< const std::shared_ptr< T >& >( value );
        return p.get();
      },
      []( const std::any& value ) -> std::type_index {
        const auto& p = std::any_cast< const std::shared_ptr< T >& >( value );
        if ( !p ) return std::type_index( typeid(T) );
        return std::type_index( typeid(*p) );
      }
    };
    return ops;
  }

} // namespace yomap::internal

  template < typename T >
  struct TypeInfoFor< T, std::enable_if_t< is_record_v< T > > > {
    static const TypeInfo& get() {
      static const TypeInfo info = [] {
        TypeInfo i( typeid(T) );
        i.name = &internal::type_name< T >;
        i.kind = TypeKind::Record;
        i.is_abstract = std::is_abstract_v< T >;
        i.record = &internal::record_ops< T >();
        return i;
      }();
      return info;
    }
  };

} // namespace yomap

// FieldData member function definitions

inline void yomap::FieldData::set( void* instance, std::any value ) const {
  try {
    setter_( instance, std::move(value) );
  }
  catch ( const std::bad_any_cast& ) {
    std::throw_with_nested( SerializationError(
      "Unable to deserialize field " + identifier_ ) );
  }
}

inline const yomap::TypeSerializer& yomap::FieldData::serializer_for(
  const ConfigNode& node ) const
{
  const TypeSerializer* ser = node.options().serializers->resolve( type_ );
  if ( !ser ) {
    throw_error_at( node, "No type serializer found for field "
      + identifier_ + " of type " + type_.name() );
  }
  return *ser;
}

inline void yomap::FieldData::deserialize_from( void* instance,
  const ConfigNode& node ) const
{
  const TypeSerializer& ser = serializer_for( node );

  std::any value;
  if ( !node.is_virtual() ) value = ser.deserialize( type_, node );

  if ( !value.has_value() && node.options().copy_defaults ) {
    // Keep the in-memory default and record it in the document
    if ( get(instance).has_value() ) {
      ConfigNode target = node;
      serialize_to( instance, target );
    }
    return;
  }

  set( instance, std::move(value) );
}

inline void yomap::FieldData::serialize_to( const void* instance,
  ConfigNode& node ) const
{
  std::any value = get( instance );
  if ( !value.has_value() ) {
    node.set_null();
  }
  else {
    try {
      serializer_for( node ).serialize( type_, value, node );
    }
    catch ( const std::bad_any_cast& ) {
      std::throw_with_nested( SerializationError(
        "Unable to serialize field " + identifier_) );
    }
  }

  if ( !comment_.empty() ) node.set_comment_if_absent( comment_ );
}

inline yomap::FieldData yomap::FieldData::rebased(
  void* (*upcast)( void* ) ) const
{
  Getter getter = [ g = getter_, upcast ]( const void* p ) {
    return g( upcast(const_cast< void* >(p)) );
  };
  Setter setter = [ s = setter_, upcast ]( void* p, std::any v ) {
    s( upcast(p), std::move(v) );
  };
  return FieldData( identifier_, comment_, type_, std::move(getter),
    std::move(setter) );
}

// RecordBuilder member function definitions

template < typename T >
template < typename M, typename C >
inline yomap::FieldSpec& yomap::RecordBuilder< T >::field(
  const std::string& identifier, M C::* member )
{
  static_assert( std::is_base_of_v< C, T >,
    "Mapped members must belong to the record or one of its bases" );
  static_assert( is_mappable_v< M >, "Member type has no yomap mapping" );

  FieldData::Getter getter = [ member ]( const void* p ) -> std::any {
    return ValueTraits< M >::box( static_cast< const T* >( p )->*member );
  };
  FieldData::Setter setter = [ member ]( void* p, std::any v ) {
    static_cast< T* >( p )->*member = ValueTraits< M >::unbox(
      std::move(v) );
  };

  fields_.push_back( FieldSpec(identifier, &ValueTraits< M >::token,
    std::move(getter), std::move(setter)) );
  return fields_.back();
}

template < typename T >
template < typename Base >
inline yomap::RecordBuilder< T >& yomap::RecordBuilder< T >::inherit() {
  static_assert( std::is_base_of_v< Base, T >,
    "inherit<Base>() requires Base to be a base class of the record" );
  static_assert( is_record_v< Base >,
    "inherit<Base>() requires Base to declare map_fields()" );

  bases_.push_back( BaseEntry {
    &type_of< Base >,
    &internal::record_fields< Base >,
    []( void* p ) -> void* {
      return static_cast< Base* >( static_cast< T* >(p) );
    }
  } );
  return *this;
}

template < typename T >
inline typename yomap::RecordBuilder< T >::FieldList
  yomap::RecordBuilder< T >::collect() const
{
  FieldList out;
  for ( const FieldSpec& spec : fields_ ) {
    const std::string& wire = spec.path_.empty() ? spec.identifier_
      : spec.path_;
    out.emplace_back( wire, FieldData(spec.identifier_, spec.comment_,
      spec.token_(), spec.getter_, spec.setter_) );
  }
  for ( const BaseEntry& base : bases_ ) {
    for ( auto& [wire, field] : base.collect() ) {
      out.emplace_back( wire, field.rebased(base.upcast) );
    }
  }
  return out;
}

template < typename T >
inline std::vector< yomap::TypeToken >
  yomap::RecordBuilder< T >::supertypes() const
{
  std::vector< TypeToken > out;
  for ( const BaseEntry& base : bases_ ) out.push_back( base.token() );
  return out;
}

// ObjectMapperBase member function definitions

inline yomap::ObjectMapperBase::ObjectMapperBase( TypeToken type,
  Constructor constructor,
  std::vector< std::pair< std::string, FieldData > > fields )
  : type_( type ), constructor_( constructor )
{
  if ( type_.is_abstract() ) {
    throw SerializationError( "ObjectMapper can only work with concrete "
      "types, got " + type_.name() );
  }
  // A path already claimed by a more-derived record is never replaced
  for ( auto& [wire, field] : fields ) {
    fields_.emplace( wire, field );
  }
}

inline std::any yomap::ObjectMapperBase::create_instance() const {
  if ( !constructor_ ) {
    throw SerializationError( "No zero-arg constructor is available for "
      + type_.name() );
  }
  return type_.info().record->wrap( constructor_() );
}

inline void yomap::ObjectMapperBase::populate_instance( void* instance,
  const ConfigNode& source ) const
{
  for ( const auto& [wire, field] : fields_ ) {
    field.deserialize_from( instance, source.child(wire) );
  }

  if ( source.is_virtual() ) {
    ConfigNode target = source;
    target.set_mapping();
  }
}

inline void yomap::ObjectMapperBase::serialize_instance(
  const void* instance, ConfigNode& target ) const
{
  for ( const auto& [wire, field] : fields_ ) {
    ConfigNode child = target.child( wire );
    field.serialize_to( instance, child );
  }
}

// ObjectMapper member function definitions

template < typename T >
inline yomap::ObjectMapper< T >::ObjectMapper()
  : ObjectMapperBase( type_of< T >(), internal::constructor_for< T >(),
    internal::record_fields< T >() ) {}

template < typename T >
inline std::shared_ptr< const yomap::ObjectMapper< T > >
  yomap::ObjectMapper< T >::for_type()
{
  return ObjectMapperFactory::instance()->get_mapper< T >();
}

// ObjectMapperFactory member function definitions

inline std::shared_ptr< yomap::ObjectMapperFactory >
  yomap::ObjectMapperFactory::instance()
{
  static const std::shared_ptr< ObjectMapperFactory > factory
    = std::make_shared< ObjectMapperFactory >();
  return factory;
}

inline std::shared_ptr< const yomap::ObjectMapperBase >
  yomap::ObjectMapperFactory::get_mapper( const TypeToken& type )
{
  if ( type.kind() != TypeKind::Record ) {
    throw SerializationError( "Type " + type.name()
      + " is not a mappable record" );
  }

  std::lock_guard< std::mutex > lock( mutex_ );
  auto it = mappers_.find( type.raw() );
  if ( it != mappers_.end() ) return it->second;

  auto mapper = type.info().record->make_mapper();
  mappers_.emplace( type.raw(), mapper );
  return mapper;
}

template < typename Base, typename Derived >
inline void yomap::ObjectMapperFactory::register_subtype(
  const std::string& tag )
{
  static_assert( std::is_base_of_v< Base, Derived >,
    "register_subtype<Base, Derived>() requires Derived to derive from Base" );
  static_assert( is_record_v< Derived > && !std::is_abstract_v< Derived >,
    "Registered subtypes must be concrete records" );

  SubtypeEntry entry {
    tag,
    type_of< Derived >(),
    []( const std::any& derived ) -> std::any {
      return std::any( std::shared_ptr< Base >(
        std::any_cast< const std::shared_ptr< Derived >& >(derived) ) );
    },
    []( void* base ) -> void* {
      Base* b = static_cast< Base* >( base );
      if constexpr ( std::is_polymorphic_v< Base > ) {
        return dynamic_cast< Derived* >( b );
      }
      else {
        return static_cast< Derived* >( b );
      }
    }
  };
  add_subtype( type_of< Base >(), std::move(entry) );
}

inline void yomap::ObjectMapperFactory::add_subtype( const TypeToken& base,
  SubtypeEntry entry )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  for ( const auto& [b, existing] : subtypes_ ) {
    if ( b != base.raw() || existing.tag != entry.tag ) continue;
    if ( existing.type == entry.type ) return;
    std::ostringstream oss;
    oss << "Subtype tag " << entry.tag << " for " << base.name()
      << " is already registered to " << existing.type.name();
    throw SerializationError( oss.str() );
  }
  subtypes_.emplace_back( base.raw(), std::move(entry) );
}

inline std::optional< yomap::SubtypeEntry >
  yomap::ObjectMapperFactory::find_subtype( const TypeToken& base,
  const std::string& tag ) const
{
  std::lock_guard< std::mutex > lock( mutex_ );
  for ( const auto& [b, entry] : subtypes_ ) {
    if ( b == base.raw() && entry.tag == tag ) return entry;
  }
  return std::nullopt;
}

inline std::optional< yomap::SubtypeEntry >
  yomap::ObjectMapperFactory::find_subtype( const TypeToken& base,
  std::type_index runtime ) const
{
  std::lock_guard< std::mutex > lock( mutex_ );
  for ( const auto& [b, entry] : subtypes_ ) {
    if ( b == base.raw() && entry.type.raw() == runtime ) return entry;
  }
  return std::nullopt;
}
