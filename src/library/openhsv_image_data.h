#ifndef OPENHSV_IMAGE_DATA__H
#define OPENHSV_IMAGE_DATA__H

#define CHECK_BOUNDS

#include <openhsv_unbls.h>
#include <openhsv_message.h>

namespace openhsv {

  // planar storage, i is the column, j the row, c the channel
  class image_data {

  protected :
    size_t rows_;
    size_t cols_;
    size_t channels_;
    
  public :

    unbls::vector_double data;
    
    image_data ();
    image_data ( size_t ncols, size_t nrows, size_t nchannels=1);
    image_data ( size_t ncols, size_t nrows, const unbls::vector_double& i_data);
    image_data ( size_t ncols, size_t nrows, size_t nchannels, const unbls::vector_double& i_data);
    void resize( size_t ncols, size_t nrows, size_t nchannels=1); 
    size_t n_rows ( ) const { return rows_; }
    size_t n_cols ( ) const { return cols_; }
    size_t n_channels ( ) const { return channels_; }
    size_t Ny ( ) const { return rows_; }
    size_t Nx ( ) const { return cols_; }
    size_t Nc ( ) const { return channels_; }
    size_t n_pixels ( ) const { return rows_*cols_; }
    bool same_shape ( const image_data& other ) const;
    
    inline double& operator()(const int i, const int j, const int c=0) {
#ifdef CHECK_BOUNDS
      if (i<0 || i>=int(cols_) || j<0 || j>=int(rows_) || c<0 || c>=int(channels_))
	OPENHSV_ERROR("Out of range (" << i << "," << j << "," << c << ") in " << cols_ << "x" << rows_ << "x" << channels_ << " image");
#endif
      return data[i+(j+c*rows_)*cols_];
    }
    
    inline const double& operator()(const int i, const int j, const int c=0) const {
#ifdef CHECK_BOUNDS
      if (i<0 || i>=int(cols_) || j<0 || j>=int(rows_) || c<0 || c>=int(channels_))
	OPENHSV_ERROR("Out of range (" << i << "," << j << "," << c << ") in " << cols_ << "x" << rows_ << "x" << channels_ << " image");
#endif
      return data[i+(j+c*rows_)*cols_];
    }

  };
}

#endif
