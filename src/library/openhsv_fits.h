#ifndef OPENHSV_FITS__H
#define OPENHSV_FITS__H

#include <string>
#include <vector>

#include <fitsio.h>

#include <openhsv_image_data.h>
#include <openhsv_analysis.h>

namespace openhsv {

  /*
    video layout in the primary HDU :
    NAXIS=2 : a single gray frame
    NAXIS=3 : gray frames, NAXIS3 is the number of frames
    NAXIS=4 : NAXIS3 is the number of channels (1 or 3), NAXIS4 the number of frames
   */
  void read_fits_video(const std::string& path, std::vector<image_data>& frames);
  void write_fits_video(const std::string& path, const std::vector<image_data>& frames);
  
  /*
    primary HDU : cube of segmentation maps (EXTNAME=SEGMENTATION)
    HDU 2 : binary table GAW with columns FRAME and GAW
   */
  void write_analysis_fits(const std::string& path, const AnalysisResult& result);
  void read_gaw_fits(const std::string& path, unbls::vector_double& gaw);
  void read_segmentation_fits(const std::string& path, std::vector<image_data>& segmentation);
  
  //! ASCII list, one line per frame
  void write_gaw_list(const std::string& path, const unbls::vector_double& gaw);
  
  //! 1-based index of the HDU with this EXTNAME, -1 if none
  int find_hdu( fitsfile *fp, const std::string& extname, const std::string& alternate_extname="");
  
}

#endif
