#ifndef OPENHSV_PREPROCESS__H
#define OPENHSV_PREPROCESS__H

#include <openhsv_image_data.h>

namespace openhsv {

  // luminance weights of the ITU-R 709 primaries
  const double RGB2GRAY_R = 0.2125;
  const double RGB2GRAY_G = 0.7154;
  const double RGB2GRAY_B = 0.0721;
  
  class Padding {
  public :
    int left,right,top,bottom;
    Padding() : left(0), right(0), top(0), bottom(0) {}
    bool IsNull() const { return left==0 && right==0 && top==0 && bottom==0; }
  };

  //! 0..255 -> -1..1
  image_data normalize(const image_data& img);
  
  //! weighted sum of R,G,B for 3 channel images, 1 channel images are returned as is
  image_data rgb2gray(const image_data& img);
  
  //! amount of padding for one dimension of size n, 0 if n<=3 or n is already a multiple
  int needed_padding(size_t n, int multiple_of);
  
  /*! pads rows and columns to a multiple of multiple_of, as required
    by U-Net like networks, half of the padding goes before the image,
    the odd pixel after, padded pixels are set to cval
   */
  image_data divpad(const image_data& img, int multiple_of=32, const double& cval=0, Padding* padding=0);
  
  //! removes the padding added by divpad
  image_data crop(const image_data& img, const Padding& padding);
  
}

#endif
