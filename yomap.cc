#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "yomap/yomap.hh"

namespace example {

  enum class Level { DEBUG, INFO, WARNING, ERROR };

} // namespace example

template <>
struct yomap::EnumNames< example::Level > {
  static inline const std::vector< std::pair< std::string, example::Level > >
    constants = {
      { "DEBUG", example::Level::DEBUG },
      { "INFO", example::Level::INFO },
      { "WARNING", example::Level::WARNING },
      { "ERROR", example::Level::ERROR }
    };
};

namespace example {

  struct Section {
    yomap::Uuid id;
    std::string name;
    int priority = 0;

    static void map_fields( yomap::RecordBuilder< Section >& b ) {
      b.field( "id", &Section::id );
      b.field( "name", &Section::name );
      b.field( "priority", &Section::priority );
    }
  };

  struct Sink {
    virtual ~Sink() = default;
    virtual std::string describe() const = 0;

    std::string label = "main";

    static void map_fields( yomap::RecordBuilder< Sink >& b ) {
      b.field( "label", &Sink::label );
    }
  };

  struct ConsoleSink : Sink {
    bool color = true;
    std::string describe() const override { return "console"; }

    static void map_fields( yomap::RecordBuilder< ConsoleSink >& b ) {
      b.inherit< Sink >();
      b.field( "color", &ConsoleSink::color );
    }
  };

  struct FileSink : Sink {
    std::string file = "yomap.log";
    std::string describe() const override { return "file " + file; }

    static void map_fields( yomap::RecordBuilder< FileSink >& b ) {
      b.inherit< Sink >();
      b.field( "file", &FileSink::file );
    }
  };

  struct ExampleConfig {
    std::string item_name = "example";
    Level level = Level::INFO;
    yomap::Pattern filter = yomap::Pattern( ".*" );
    std::vector< Section > sections;
    std::shared_ptr< Sink > sink = std::make_shared< ConsoleSink >();
    yomap::ordered_map< std::string, int > limits;

    static void map_fields( yomap::RecordBuilder< ExampleConfig >& b ) {
      b.field( "item_name", &ExampleConfig::item_name )
        .path( "item-name" )
        .comment( "Name reported in the output" );
      b.field( "level", &ExampleConfig::level );
      b.field( "filter", &ExampleConfig::filter );
      b.field( "sections", &ExampleConfig::sections );
      b.field( "sink", &ExampleConfig::sink );
      b.field( "limits", &ExampleConfig::limits );
    }
  };

} // namespace example

// Reads a YAML configuration from the file named on the command line (or
// from stdin), maps it onto an ExampleConfig with defaults copied back,
// and prints the completed document
int main( int argc, char** argv ) {
  try {
    auto factory = yomap::ObjectMapperFactory::instance();
    factory->register_subtype< example::Sink, example::ConsoleSink >(
      "console" );
    factory->register_subtype< example::Sink, example::FileSink >( "file" );

    yomap::YamlLoader loader( yomap::ConfigurationOptions::defaults()
      .with_copy_defaults(true) );

    std::ifstream file;
    if ( argc > 1 ) {
      file.open( argv[1] );
      if ( !file ) {
        throw std::runtime_error( std::string("Unable to open ")
          + argv[1] );
      }
    }
    yomap::ConfigNode root = loader.load( argc > 1
      ? static_cast< std::istream& >( file ) : std::cin );

    example::ExampleConfig config;
    yomap::ObjectMapper< example::ExampleConfig >().bind( config )
      .populate( root );

    std::cout << yomap::YamlLoader::to_string( root );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[yomap] error: " << ex.what() << "\n";
    return 1;
  }
}
