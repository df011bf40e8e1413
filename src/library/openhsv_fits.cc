#include <iostream>
#include <iomanip>
#include <fstream>
#include <cstdio>
#include <string>

#include <openhsv_fits.h>
#include <openhsv_message.h>

using namespace std;

#define CHECKERROR(what) if(status) {fits_report_error(stderr, status); int close_status=0; fits_close_file(fp,&close_status); OPENHSV_ERROR("fits error " << what);}

int openhsv::find_hdu( fitsfile *fp, const std::string& extname, const std::string& alternate_extname) {
  int status = 0;
  int nhdu = 0;
  fits_get_num_hdus(fp, &nhdu, &status);
  if(status) {
    fits_report_error(stderr, status);
    OPENHSV_ERROR("fits error counting HDUs");
  }
  int current = 0;
  fits_get_hdu_num(fp, &current);
  
  int found = -1;
  for(int hdu=1; hdu<=nhdu && found<0; hdu++) {
    fits_movabs_hdu(fp, hdu, NULL, &status);
    if(status) break;
    char value[FLEN_VALUE];
    fits_read_key(fp, TSTRING, "EXTNAME", value, NULL, &status);
    if(status==KEY_NO_EXIST) { status=0; fits_clear_errmsg(); continue; }
    if(status) break;
    string name(value);
    if(name==extname || (!alternate_extname.empty() && name==alternate_extname)) found=hdu;
  }
  if(status) {
    fits_report_error(stderr, status);
    OPENHSV_ERROR("fits error while looking for HDU " << extname);
  }
  fits_movabs_hdu(fp, current, NULL, &status);
  return found;
}

void openhsv::read_fits_video(const std::string& path, std::vector<openhsv::image_data>& frames) {
  
  fitsfile *fp = 0;
  int status = 0;
  fits_open_file(&fp, path.c_str(), READONLY, &status);
  if(status) {
    fits_report_error(stderr, status);
    OPENHSV_ERROR("cannot open " << path);
  }
  
  int naxis = 0;
  long naxes[4] = {1,1,1,1};
  fits_get_img_dim(fp, &naxis, &status); CHECKERROR("reading NAXIS of " << path);
  if(naxis<2 || naxis>4) {
    fits_close_file(fp, &status);
    OPENHSV_ERROR(path << " has NAXIS=" << naxis << ", expect 2, 3 or 4");
  }
  fits_get_img_size(fp, naxis, naxes, &status); CHECKERROR("reading image size of " << path);
  
  size_t ncols = naxes[0];
  size_t nrows = naxes[1];
  size_t nchannels = 1;
  size_t nframes = 1;
  if(naxis==3) {
    nframes = naxes[2];
  } else if(naxis==4) {
    nchannels = naxes[2];
    nframes = naxes[3];
  }
  if(ncols==0 || nrows==0 || nframes==0) {
    fits_close_file(fp, &status);
    OPENHSV_ERROR(path << " has empty frames (" << ncols << "x" << nrows << ", " << nframes << " frames)");
  }
  if(nchannels!=1 && nchannels!=3) {
    fits_close_file(fp, &status);
    OPENHSV_ERROR(path << " frames have " << nchannels << " channels, expect 1 or 3");
  }
  
  OPENHSV_INFO("reading " << nframes << " frames of " << ncols << "x" << nrows << "x" << nchannels << " from " << path);
  
  frames.clear();
  size_t frame_size = ncols*nrows*nchannels;
  for(size_t f=0;f<nframes;f++) {
    frames.push_back(image_data(ncols,nrows,nchannels));
    double nullval = 0;
    int anynul = 0;
    fits_read_img(fp, TDOUBLE, LONGLONG(f*frame_size+1), LONGLONG(frame_size), &nullval,
		  &frames.back().data[0], &anynul, &status);
    CHECKERROR("reading frame " << f << " of " << path);
  }
  fits_close_file(fp, &status);
}

// NAXIS=3 for gray frames, NAXIS=4 otherwise
static void write_image_stack(fitsfile *fp, const std::vector<openhsv::image_data>& frames, const std::string& path) {
  
  int status = 0;
  const openhsv::image_data& first = frames[0];
  for(size_t f=1;f<frames.size();f++) {
    if(!frames[f].same_shape(first)) {
      fits_close_file(fp, &status);
      OPENHSV_ERROR("frame " << f << " is " << frames[f].Nx() << "x" << frames[f].Ny() << "x" << frames[f].Nc()
		    << ", frame 0 is " << first.Nx() << "x" << first.Ny() << "x" << first.Nc());
    }
  }
  
  int naxis;
  long naxes[4];
  naxes[0] = first.Nx();
  naxes[1] = first.Ny();
  if(first.Nc()==1) {
    naxis = 3;
    naxes[2] = frames.size();
  } else {
    naxis = 4;
    naxes[2] = first.Nc();
    naxes[3] = frames.size();
  }
  fits_create_img(fp, DOUBLE_IMG, naxis, naxes, &status); CHECKERROR("creating image in " << path);
  
  size_t frame_size = first.data.size();
  for(size_t f=0;f<frames.size();f++) {
    fits_write_img(fp, TDOUBLE, LONGLONG(f*frame_size+1), LONGLONG(frame_size),
		   const_cast<double*>(&frames[f].data[0]), &status);
    CHECKERROR("writing frame " << f << " in " << path);
  }
}

void openhsv::write_fits_video(const std::string& path, const std::vector<openhsv::image_data>& frames) {
  
  if(frames.empty()) OPENHSV_ERROR("no frame to write in " << path);
  
  fitsfile *fp = 0;
  int status = 0;
  string overwrite = "!"+path;
  fits_create_file(&fp, overwrite.c_str(), &status);
  if(status) {
    fits_report_error(stderr, status);
    OPENHSV_ERROR("cannot create " << path);
  }
  write_image_stack(fp,frames,path);
  long nframes = long(frames.size());
  fits_write_key(fp, TLONG, "NFRAMES", &nframes, "number of frames", &status); CHECKERROR("writing keys in " << path);
  fits_close_file(fp, &status);
  
  OPENHSV_INFO("wrote " << frames.size() << " frames in " << path);
}

void openhsv::write_analysis_fits(const std::string& path, const openhsv::AnalysisResult& result) {
  
  if(result.gaw.size() != result.segmentation.size())
    OPENHSV_ERROR("analysis result has " << result.gaw.size() << " GAW values and "
		  << result.segmentation.size() << " segmentation maps");
  
  fitsfile *fp = 0;
  int status = 0;
  string overwrite = "!"+path;
  fits_create_file(&fp, overwrite.c_str(), &status);
  if(status) {
    fits_report_error(stderr, status);
    OPENHSV_ERROR("cannot create " << path);
  }
  
  // HDU 1, segmentation maps
  if(result.segmentation.empty()) {
    fits_create_img(fp, DOUBLE_IMG, 0, NULL, &status); CHECKERROR("creating empty primary HDU in " << path);
  } else {
    write_image_stack(fp,result.segmentation,path);
  }
  long nframes = long(result.gaw.size());
  fits_write_key(fp, TSTRING, "EXTNAME", const_cast<char*>("SEGMENTATION"), "", &status);
  fits_write_key(fp, TLONG, "NFRAMES", &nframes, "number of frames", &status);
  fits_write_comment(fp, "segmentation map of each frame, padded to the network input size", &status);
  CHECKERROR("writing keys in " << path);
  
  // HDU 2, glottal area waveform
  char *ttype[] = { const_cast<char*>("FRAME"), const_cast<char*>("GAW") };
  char *tform[] = { const_cast<char*>("J"), const_cast<char*>("D") };
  char *tunit[] = { const_cast<char*>(""), const_cast<char*>("") };
  fits_create_tbl(fp, BINARY_TBL, 0, 2, ttype, tform, tunit, const_cast<char*>("GAW"), &status); CHECKERROR("creating GAW table in " << path);
  fits_write_comment(fp, "glottal area waveform, sum of the segmentation map of each frame", &status);
  if(nframes>0) {
    std::vector<int> frame_index(nframes);
    for(long f=0;f<nframes;f++) frame_index[f]=int(f);
    fits_write_col(fp, TINT, 1, 1, 1, nframes, &frame_index[0], &status);
    fits_write_col(fp, TDOUBLE, 2, 1, 1, nframes, const_cast<double*>(&result.gaw[0]), &status);
  }
  CHECKERROR("writing GAW table in " << path);
  
  fits_close_file(fp, &status);
  
  OPENHSV_INFO("wrote segmentation and GAW of " << nframes << " frames in " << path);
}

void openhsv::read_gaw_fits(const std::string& path, unbls::vector_double& gaw) {
  
  fitsfile *fp = 0;
  int status = 0;
  fits_open_file(&fp, path.c_str(), READONLY, &status);
  if(status) {
    fits_report_error(stderr, status);
    OPENHSV_ERROR("cannot open " << path);
  }
  int hdu = find_hdu(fp,"GAW");
  if(hdu<0) {
    fits_close_file(fp, &status);
    OPENHSV_ERROR("no GAW table in " << path);
  }
  fits_movabs_hdu(fp, hdu, NULL, &status); CHECKERROR("moving to GAW table in " << path);
  
  long nrows = 0;
  int colnum = 0;
  fits_get_num_rows(fp, &nrows, &status); CHECKERROR("reading number of rows in " << path);
  fits_get_colnum(fp, CASEINSEN, const_cast<char*>("GAW"), &colnum, &status); CHECKERROR("no GAW column in " << path);
  
  gaw.resize(nrows);
  if(nrows>0) {
    double nullval = 0;
    int anynul = 0;
    fits_read_col(fp, TDOUBLE, colnum, 1, 1, nrows, &nullval, &gaw[0], &anynul, &status);
    CHECKERROR("reading GAW column in " << path);
  }
  fits_close_file(fp, &status);
}

void openhsv::read_segmentation_fits(const std::string& path, std::vector<openhsv::image_data>& segmentation) {
  read_fits_video(path,segmentation);
}

void openhsv::write_gaw_list(const std::string& path, const unbls::vector_double& gaw) {
  
  ofstream os(path.c_str());
  if(!os) OPENHSV_ERROR("cannot open " << path << " for writing");
  
  os << setprecision(10);
  os << "# frame : frame index" << endl;
  os << "# gaw : glottal area, sum of the segmentation map" << endl;
  os << "#end" << endl;
  for(size_t f=0;f<gaw.size();f++)
    os << f << " " << gaw[f] << endl;
  os.close();
  
  OPENHSV_INFO("wrote " << path);
}
