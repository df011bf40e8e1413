#include <openhsv_image_data.h>

openhsv::image_data::image_data() : 
  rows_(0), cols_(0), channels_(1)
{
}

openhsv::image_data::image_data(size_t ncols, size_t nrows, size_t nchannels)
{
  resize(ncols,nrows,nchannels);
}

openhsv::image_data::image_data(size_t ncols, size_t nrows, const unbls::vector_double& i_data)
{
  resize(ncols,nrows,1);
  if(i_data.size() != data.size())
    OPENHSV_ERROR("image_data: " << i_data.size() << " values for a " << ncols << "x" << nrows << " image");
  data = i_data; // copy
}

openhsv::image_data::image_data(size_t ncols, size_t nrows, size_t nchannels, const unbls::vector_double& i_data)
{
  resize(ncols,nrows,nchannels);
  if(i_data.size() != data.size())
    OPENHSV_ERROR("image_data: " << i_data.size() << " values for a " << ncols << "x" << nrows << "x" << nchannels << " image");
  data = i_data; // copy
}

void openhsv::image_data::resize(size_t ncols, size_t nrows, size_t nchannels) {
  if(nchannels==0) OPENHSV_ERROR("image_data needs at least one channel");
  rows_ = nrows;
  cols_ = ncols;
  channels_ = nchannels;
  data.resize(rows_*cols_*channels_);
  unbls::zero(data);
}

bool openhsv::image_data::same_shape(const image_data& other) const {
  return rows_==other.rows_ && cols_==other.cols_ && channels_==other.channels_;
}
