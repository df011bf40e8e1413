#ifndef OPENHSV_OPTIONS__H
#define OPENHSV_OPTIONS__H

#include <vector>
#include <string>
#include <ostream>

#include <boost/program_options.hpp>

namespace popts = boost::program_options;

namespace openhsv {
  
  class Options {

  public :

    std::string input_video_filename;
    std::string model_filename;
    std::string output_fits_filename;
    std::string output_list_filename;
    std::string config_filename;
    
    bool   no_normalize;
    int    multiple_of;
    double cval;
    int    preview;
    
    bool verbose;
    bool quiet;
    bool debug;
    
    popts::variables_map vm;    
    popts::options_description desc;
    
    //! OPTIONS_OK to proceed, OPTIONS_HELP if usage was printed, throws on invalid arguments
    int parse(int argc, char *argv[] ); 
    int parse(const std::vector<std::string>& args);
    
    //! verbose, quiet and debug flags to the message functions
    void apply_message_settings() const;
    
    void print_usage(std::ostream& os, const std::string& program) const;
    
    Options();
    
  private :
    
    void check() const;
    
  };
  
  const int OPTIONS_OK = 0;
  const int OPTIONS_HELP = 1;
  
}

#endif
