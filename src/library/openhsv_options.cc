#include <string>
#include <iostream>
#include <fstream>

#include <openhsv_options.h>
#include <openhsv_message.h>

using namespace std;

openhsv::Options::Options() :
  desc("Allowed Options")
{
  input_video_filename="";
  model_filename="";
  output_fits_filename="";
  output_list_filename="";
  config_filename="";
  
  no_normalize=false;
  multiple_of=32;
  cval=0;
  preview=40;
  
  verbose=false;
  quiet=false;
  debug=false;
  
  desc.add_options()
    ( "help,h", "display usage information" )
    ( "in", popts::value<string>( &input_video_filename ), "input video fits file name (mandatory)" )
    ( "model", popts::value<string>( &model_filename ), "network xml file name (mandatory)" )
    ( "out", popts::value<string>( &output_fits_filename ), "output fits file name with segmentation and GAW (mandatory)" )
    ( "out-list", popts::value<string>( &output_list_filename ), "output ASCII file name with the GAW" )
    ( "no-normalize", popts::bool_switch( &no_normalize ), "do not map 0..255 to -1..1 before segmentation" )
    ( "multiple-of", popts::value<int>( &multiple_of ), "frames are padded to a multiple of this (default is 32)" )
    ( "cval", popts::value<double>( &cval ), "value of padded pixels (default is 0)" )
    ( "preview", popts::value<int>( &preview ), "number of last GAW values printed at the end (default is 40)" )
    ( "config", popts::value<string>( &config_filename ), "configuration file with the same keys, command line has precedence" )
    ( "verbose,v", popts::bool_switch( &verbose ), "turn on verbose mode" )
    ( "quiet", popts::bool_switch( &quiet ), "no info message, only warning" )
    ( "debug", popts::bool_switch( &debug ), "turn on debug mode" )
    ;
}

int openhsv::Options::parse(int argc, char *argv[] ) {
  
  try {
    
    popts::store(popts::command_line_parser( argc, argv ).options(desc).run(), vm);
    
    if(vm.count("config")) {
      string filename = vm["config"].as<string>();
      ifstream is(filename.c_str());
      if(!is) OPENHSV_ERROR("cannot open configuration file " << filename);
      popts::store(popts::parse_config_file(is, desc), vm);
    }
    
    popts::notify(vm);
    
  } catch(popts::error& e) {
    OPENHSV_ERROR("invalid arguments : " << e.what());
  }
  
  if ( vm.count( "help" ) ) {
    print_usage(cerr, (argc>0) ? argv[0] : "openhsv_segment");
    return OPTIONS_HELP;
  }
  
  check();
  return OPTIONS_OK;
}

int openhsv::Options::parse(const std::vector<std::string>& args) {
  vector<char*> argv;
  for(size_t a=0;a<args.size();a++) argv.push_back(const_cast<char*>(args[a].c_str()));
  argv.push_back(0);
  return parse(int(args.size()),&argv[0]);
}

void openhsv::Options::check() const {
  if(input_video_filename.empty()) OPENHSV_ERROR("missing input video, use --in");
  if(model_filename.empty()) OPENHSV_ERROR("missing network, use --model");
  if(output_fits_filename.empty()) OPENHSV_ERROR("missing output file, use --out");
  if(multiple_of<1) OPENHSV_ERROR("--multiple-of must be positive, got " << multiple_of);
  if(preview<0) OPENHSV_ERROR("--preview must be positive or null, got " << preview);
}

void openhsv::Options::apply_message_settings() const {
  openhsv_set_verbose(verbose || debug);
  if(quiet) openhsv_set_verbose(false);
  openhsv_set_debug(debug);
}

void openhsv::Options::print_usage(std::ostream& os, const std::string& program) const {
  os << endl;
  os << desc << endl;
  os << "example:" << endl;
  os << program << " --in video.fits --model network.xml --out gaw.fits" << endl;
}
