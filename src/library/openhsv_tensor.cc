#include <openhsv_tensor.h>
#include <openhsv_message.h>

std::ostream& openhsv::operator << (std::ostream& os, const openhsv::Shape& s) {
  os << "(" << s.height << ", " << s.width << ", " << s.channels << ")";
  return os;
}

openhsv::tensor::tensor() : height(0), width(0), channels(0) {}

openhsv::tensor::tensor(int h, int w, int c) {
  resize(h,w,c);
}

openhsv::tensor::tensor(const openhsv::Shape& s) {
  resize(s.height,s.width,s.channels);
}

void openhsv::tensor::resize(int h, int w, int c) {
  if(h<0 || w<0 || c<0) OPENHSV_ERROR("invalid tensor shape " << Shape(h,w,c));
  height=h;
  width=w;
  channels=c;
  data.resize(size_t(h)*size_t(w)*size_t(c));
  unbls::zero(data);
}

void openhsv::tensor::clear() {
  height=width=channels=0;
  unbls::vector_double().swap(data);
}

openhsv::tensor openhsv::image_to_tensor(const openhsv::image_data& img) {
  tensor t(int(img.Ny()),int(img.Nx()),int(img.Nc()));
  for(size_t c=0;c<img.Nc();c++)
    for(size_t j=0;j<img.Ny();j++)
      for(size_t i=0;i<img.Nx();i++)
	t(j,i,c)=img(i,j,c);
  return t;
}

openhsv::image_data openhsv::tensor_to_image(const openhsv::tensor& t) {
  if(t.channels<1) OPENHSV_ERROR("cannot convert a tensor without channels to an image");
  image_data img(t.width,t.height,t.channels);
  for(int c=0;c<t.channels;c++)
    for(int j=0;j<t.height;j++)
      for(int i=0;i<t.width;i++)
	img(i,j,c)=t(j,i,c);
  return img;
}
