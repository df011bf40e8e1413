#ifndef OPENHSV_TENSOR__H
#define OPENHSV_TENSOR__H

#include <ostream>

#include <openhsv_unbls.h>
#include <openhsv_image_data.h>

namespace openhsv {

  class Shape {
  public :
    int height;
    int width;
    int channels;
    Shape(int h=0, int w=0, int c=0) : height(h), width(w), channels(c) {}
    bool operator==(const Shape& other) const { return height==other.height && width==other.width && channels==other.channels; }
    bool operator!=(const Shape& other) const { return !(*this==other); }
  };

  std::ostream& operator << (std::ostream& os, const Shape& s);
  
  // channel last storage, same memory layout as a keras (batch of one) tensor
  class tensor {

  public :
    
    int height;
    int width;
    int channels;
    unbls::vector_double data;

    tensor();
    tensor(int h, int w, int c);
    tensor(const Shape& s);
    
    void resize(int h, int w, int c);
    Shape shape() const { return Shape(height,width,channels); }
    size_t n_pixels() const { return size_t(height)*size_t(width); }
    void clear();
    
    double& operator()(const int y, const int x, const int c) { return data[(size_t(y)*width+x)*channels+c]; }
    const double& operator()(const int y, const int x, const int c) const { return data[(size_t(y)*width+x)*channels+c]; }
    
  };
  
  tensor image_to_tensor(const image_data& img);
  image_data tensor_to_image(const tensor& t);
  
}

#endif
