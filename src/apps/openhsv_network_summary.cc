#include <iostream>
#include <string>
#include <cstdlib>

#include <boost/program_options.hpp>

#include <openhsv_message.h>
#include <openhsv_network.h>
#include <openhsv_network_io.h>

using namespace std;

namespace popts = boost::program_options;

int main ( int argc, char *argv[] ) {
  
  string model_filename="";
  int width=256;
  int height=256;
  
  // reading arguments
  // --------------------------------------------
  popts::options_description desc ( "Allowed Options" );
  desc.add_options()
    ( "help,h", "display usage information" )
    ( "model", popts::value<string>( &model_filename ), "network xml file name" )
    ( "width", popts::value<int>( &width ), "input width for the output shapes (default is 256)" )
    ( "height", popts::value<int>( &height ), "input height for the output shapes (default is 256)" )
    ( "verbose,v", "turn on verbose mode" )
    ;

  popts::variables_map vm;
  
  try {
    popts::store(popts::command_line_parser( argc, argv ).options(desc).run(), vm);
    popts::notify(vm);
  } catch(popts::error& e) {
    cerr << "FATAL ERROR " << e.what() << endl;
    return EXIT_FAILURE;
  }
  
  if ( ( argc < 2 ) || vm.count( "help" ) || ( ! vm.count( "model" ) ) ) {
    cerr << endl;
    cerr << desc << endl;
    cerr << "example:" << endl;
    cerr << argv[0] << " --model network.xml --width 256 --height 512" << endl;
    return EXIT_FAILURE;
  }
  
  openhsv_set_verbose(vm.count("verbose")>0);
  
  try {
    
    openhsv::Network_p network = openhsv::read_network(model_filename);
    network->Summary(cout,width,height);
    
  }catch(openhsv::exception& e) {
    cerr << "FATAL ERROR (openhsv) " << e.what() << endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
