#include <openhsv_preprocess.h>
#include <openhsv_message.h>

openhsv::image_data openhsv::normalize(const openhsv::image_data& img) {
  image_data res = img;
  for(size_t k=0;k<res.data.size();k++)
    res.data[k] = res.data[k]/127.5 - 1;
  return res;
}

openhsv::image_data openhsv::rgb2gray(const openhsv::image_data& img) {
  if(img.Nc()==1) return img;
  if(img.Nc()!=3) OPENHSV_ERROR("rgb2gray expects 1 or 3 channels, got " << img.Nc());
  
  size_t npix = img.n_pixels();
  image_data gray(img.Nx(),img.Ny());
  const double* r = &img.data[0];
  const double* g = r+npix;
  const double* b = g+npix;
  for(size_t k=0;k<npix;k++)
    gray.data[k] = RGB2GRAY_R*r[k] + RGB2GRAY_G*g[k] + RGB2GRAY_B*b[k];
  return gray;
}

int openhsv::needed_padding(size_t n, int multiple_of) {
  if(multiple_of<=0) OPENHSV_ERROR("padding multiple must be positive, got " << multiple_of);
  if(n>3 && n%multiple_of)
    return multiple_of - int(n%multiple_of);
  return 0;
}

openhsv::image_data openhsv::divpad(const openhsv::image_data& img, int multiple_of, const double& cval, openhsv::Padding* padding) {
  
  int need_rows = needed_padding(img.Ny(),multiple_of);
  int need_cols = needed_padding(img.Nx(),multiple_of);
  
  Padding pad;
  pad.top    = need_rows/2;
  pad.bottom = need_rows/2 + need_rows%2;
  pad.left   = need_cols/2;
  pad.right  = need_cols/2 + need_cols%2;
  if(padding) *padding = pad;
  
  OPENHSV_DEBUG("divpad " << img.Nx() << "x" << img.Ny() << " -> "
		<< img.Nx()+need_cols << "x" << img.Ny()+need_rows);
  
  if(pad.IsNull()) return img;
  
  image_data res(img.Nx()+need_cols,img.Ny()+need_rows,img.Nc());
  std::fill(res.data.begin(),res.data.end(),cval);
  for(size_t c=0;c<img.Nc();c++)
    for(size_t j=0;j<img.Ny();j++)
      for(size_t i=0;i<img.Nx();i++)
	res(i+pad.left,j+pad.top,c) = img(i,j,c);
  return res;
}

openhsv::image_data openhsv::crop(const openhsv::image_data& img, const openhsv::Padding& padding) {
  if(padding.IsNull()) return img;
  int nx = int(img.Nx()) - padding.left - padding.right;
  int ny = int(img.Ny()) - padding.top - padding.bottom;
  if(nx<=0 || ny<=0)
    OPENHSV_ERROR("cannot crop a " << img.Nx() << "x" << img.Ny() << " image by "
		  << padding.left << "," << padding.right << "," << padding.top << "," << padding.bottom);
  image_data res(nx,ny,img.Nc());
  for(size_t c=0;c<img.Nc();c++)
    for(int j=0;j<ny;j++)
      for(int i=0;i<nx;i++)
	res(i,j,c) = img(i+padding.left,j+padding.top,c);
  return res;
}
