#ifndef OPENHSV_SEGMENT_MAIN__H
#define OPENHSV_SEGMENT_MAIN__H

#include <vector>
#include <string>

// returns EXIT_SUCCESS or EXIT_FAILURE, see openhsv::Options for the arguments
int openhsv_segment_main ( int argc, char *argv[] );

namespace openhsv {
  
  class Options;
  
  //! reads the video and the network, segments, writes the results
  int segment_video(const Options& opts);
  
  //! same as openhsv_segment_main, args[0] is the program name
  int segment_main(const std::vector<std::string>& args);
  
}

#endif
