#include <iostream>
#include <iomanip>
#include <string>
#include <cstdlib>
#include <sstream>
#include <vector>
#include <ctime>

#include <openhsv_segment_main.h>
#include <openhsv_options.h>
#include <openhsv_message.h>
#include <openhsv_fits.h>
#include <openhsv_network_io.h>
#include <openhsv_analysis.h>

using namespace std;

/*
  input video :
  FITS primary HDU, NAXIS1=columns NAXIS2=rows, then frames (gray)
  or channels and frames (RGB), pixel values in 0..255

  output :
  HDU 1 SEGMENTATION : cube of segmentation maps (padded frame size)
  HDU 2 GAW : binary table FRAME, GAW
 */

int openhsv::segment_video(const openhsv::Options& opts) {
  
  clock_t tstart = clock();
  
  OPENHSV_INFO("reading network " << opts.model_filename);
  Network_p network = read_network(opts.model_filename);
  
  OPENHSV_INFO("reading video " << opts.input_video_filename);
  vector<image_data> frames;
  read_fits_video(opts.input_video_filename,frames);
  if(frames.empty()) OPENHSV_ERROR("no frame in " << opts.input_video_filename);
  
  Analysis analysis(network);
  analysis.multiple_of = opts.multiple_of;
  analysis.cval = opts.cval;
  
  analysis.segment_sequence(frames,!opts.no_normalize,true);
  
  AnalysisResult result = analysis.get();
  write_analysis_fits(opts.output_fits_filename,result);
  if(!opts.output_list_filename.empty())
    write_gaw_list(opts.output_list_filename,result.gaw);
  
  if(opts.preview>0) {
    unbls::vector_double preview = analysis.gaw_preview(opts.preview);
    stringstream values;
    for(size_t f=0;f<preview.size();f++) values << " " << preview[f];
    OPENHSV_INFO("last " << preview.size() << " GAW values" << values.str());
  }
  
  OPENHSV_INFO("segmented " << frames.size() << " frames in " << setprecision(3)
	       << double(clock()-tstart)/CLOCKS_PER_SEC << " s");
  
  return EXIT_SUCCESS;
}

int openhsv_segment_main ( int argc, char *argv[] ) {
  
  openhsv::Options opts;
  
  try {
    
    if(opts.parse(argc,argv) == openhsv::OPTIONS_HELP) return EXIT_SUCCESS;
    opts.apply_message_settings();
    return openhsv::segment_video(opts);
    
  } catch(openhsv::exception& e) {
    cerr << "FATAL ERROR (openhsv) " << e.what() << endl;
    return EXIT_FAILURE;
  } catch(std::exception& e) {
    cerr << "FATAL ERROR " << e.what() << endl;
    return EXIT_FAILURE;
  }
}

int openhsv::segment_main(const std::vector<std::string>& args) {
  vector<char*> argv;
  for(size_t a=0;a<args.size();a++) argv.push_back(const_cast<char*>(args[a].c_str()));
  argv.push_back(0);
  return openhsv_segment_main(int(args.size()),&argv[0]);
}
