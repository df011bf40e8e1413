#include <cmath>
#include <algorithm>

#include <openhsv_layer.h>
#include <openhsv_linalg.h>
#include <openhsv_message.h>

// maximum number of doubles in the im2col buffer of Conv2D::Forward
#define IM2COL_BUFFER_SIZE 4194304

bool openhsv::is_known_activation(const std::string& activation) {
  return (activation=="linear" || activation=="relu" || activation=="sigmoid"
	  || activation=="tanh" || activation=="softmax");
}

void openhsv::apply_activation(const std::string& activation, openhsv::tensor& t) {

  unbls::vector_double& v = t.data;

  if(activation=="linear") {
    return;
  } else if(activation=="relu") {
    for(size_t k=0;k<v.size();k++) if(v[k]<0) v[k]=0;
  } else if(activation=="sigmoid") {
    for(size_t k=0;k<v.size();k++) v[k]=1./(1.+exp(-v[k]));
  } else if(activation=="tanh") {
    for(size_t k=0;k<v.size();k++) v[k]=tanh(v[k]);
  } else if(activation=="softmax") {
    size_t nc = size_t(t.channels);
    if(nc==0) return;
    for(size_t p=0;p<t.n_pixels();p++) {
      double* x = &v[p*nc];
      double xmax = *std::max_element(x,x+nc);
      double s = 0;
      for(size_t c=0;c<nc;c++) { x[c]=exp(x[c]-xmax); s+=x[c]; }
      for(size_t c=0;c<nc;c++) x[c]/=s;
    }
  } else {
    OPENHSV_ERROR("unknown activation '" << activation << "'");
  }
}

void openhsv::Layer::CheckNumberOfInputs(size_t n) const {
  int expected = NInputs();
  if(expected<0) {
    if(n<2) OPENHSV_ERROR(Type() << " needs at least 2 inputs, got " << n);
  } else if(int(n)!=expected) {
    OPENHSV_ERROR(Type() << " needs " << expected << " input(s), got " << n);
  }
}

// InputLayer
// ==================================================

void openhsv::InputLayer::Check() const {
  if(channels<1) OPENHSV_ERROR("invalid number of input channels " << channels);
}

openhsv::Shape openhsv::InputLayer::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  if(inputs.size()!=1) OPENHSV_ERROR("InputLayer shape needs the network input shape");
  Check();
  if(inputs[0].channels != channels)
    OPENHSV_ERROR("network expects " << channels << " input channel(s), got " << inputs[0].channels);
  return inputs[0];
}

openhsv::tensor openhsv::InputLayer::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  if(inputs.size()!=1) OPENHSV_ERROR("InputLayer forward needs the network input");
  OutputShape(std::vector<Shape>(1,inputs[0]->shape()));
  return *inputs[0];
}

// Conv2D
// ==================================================

openhsv::Conv2D::Conv2D() :
  kernel_h(1), kernel_w(1), in_channels(1), filters(1), stride_h(1), stride_w(1),
  padding("same"), activation("linear")
{
  weights.resize(1);
  bias.resize(1);
}

openhsv::Conv2D::Conv2D(int i_kernel_h, int i_kernel_w, int i_in_channels, int i_filters,
			const std::string& i_padding, const std::string& i_activation,
			int i_stride_h, int i_stride_w) :
  kernel_h(i_kernel_h), kernel_w(i_kernel_w), in_channels(i_in_channels), filters(i_filters),
  stride_h(i_stride_h), stride_w(i_stride_w), padding(i_padding), activation(i_activation)
{
  if(kernel_h<1 || kernel_w<1 || in_channels<1 || filters<1)
    OPENHSV_ERROR("invalid Conv2D kernel " << kernel_h << "x" << kernel_w << " channels " << in_channels
		  << " filters " << filters);
  weights.resize(size_t(kernel_h)*kernel_w*in_channels*filters);
  bias.resize(filters);
  unbls::zero(weights);
  unbls::zero(bias);
  Check();
}

void openhsv::Conv2D::Check() const {
  if(kernel_h<1 || kernel_w<1 || in_channels<1 || filters<1 || stride_h<1 || stride_w<1)
    OPENHSV_ERROR("invalid Conv2D kernel " << kernel_h << "x" << kernel_w << " channels " << in_channels
		  << " filters " << filters << " strides " << stride_h << "x" << stride_w);
  if(padding!="same" && padding!="valid")
    OPENHSV_ERROR("Conv2D padding must be 'same' or 'valid', got '" << padding << "'");
  if(!is_known_activation(activation))
    OPENHSV_ERROR("unknown activation '" << activation << "'");
  if(weights.size() != size_t(kernel_h)*kernel_w*in_channels*filters)
    OPENHSV_ERROR("Conv2D expects " << size_t(kernel_h)*kernel_w*in_channels*filters << " weights, has " << weights.size());
  if(bias.size() != size_t(filters))
    OPENHSV_ERROR("Conv2D expects " << filters << " biases, has " << bias.size());
}

void openhsv::Conv2D::SetWeights(const unbls::vector_double& i_weights, const unbls::vector_double& i_bias) {
  weights = i_weights;
  bias = i_bias;
  Check();
}

openhsv::Shape openhsv::Conv2D::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Check();
  const Shape& in = inputs[0];
  if(in.channels != in_channels)
    OPENHSV_ERROR("Conv2D expects " << in_channels << " channel(s), got " << in.channels);
  Shape out(0,0,filters);
  if(padding=="same") {
    out.height = (in.height+stride_h-1)/stride_h;
    out.width  = (in.width+stride_w-1)/stride_w;
  } else {
    if(in.height<kernel_h || in.width<kernel_w)
      OPENHSV_ERROR("Conv2D input " << in << " smaller than kernel " << kernel_h << "x" << kernel_w);
    out.height = (in.height-kernel_h)/stride_h+1;
    out.width  = (in.width-kernel_w)/stride_w+1;
  }
  return out;
}

void openhsv::Conv2D::PaddingBefore(const openhsv::Shape& in, int& pad_top, int& pad_left) const {
  pad_top = pad_left = 0;
  if(padding=="valid") return;
  Shape out = OutputShape(std::vector<Shape>(1,in));
  int total_h = std::max((out.height-1)*stride_h+kernel_h-in.height,0);
  int total_w = std::max((out.width-1)*stride_w+kernel_w-in.width,0);
  pad_top  = total_h/2;
  pad_left = total_w/2;
}

openhsv::tensor openhsv::Conv2D::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Shape oshape = OutputShape(std::vector<Shape>(1,inputs[0]->shape()));
  const tensor& in = *inputs[0];
  int pad_top,pad_left;
  PaddingBefore(in.shape(),pad_top,pad_left);

  tensor out(oshape);

  // start from the bias, gemm accumulates
  for(size_t p=0;p<out.n_pixels();p++)
    std::copy(bias.begin(),bias.end(),out.data.begin()+p*filters);

  // im2col by blocks of output rows
  const int ksize = kernel_h*kernel_w*in_channels;
  int rows_per_block = std::max(1,int(IM2COL_BUFFER_SIZE/(size_t(ksize)*std::max(1,oshape.width))));
  rows_per_block = std::min(rows_per_block,std::max(1,oshape.height));
  unbls::vector_double patches(size_t(rows_per_block)*oshape.width*ksize);

  for(int row0=0;row0<oshape.height;row0+=rows_per_block) {
    int nrows = std::min(rows_per_block,oshape.height-row0);
    int npix  = nrows*oshape.width;

    for(int oy=row0;oy<row0+nrows;oy++) {
      for(int ox=0;ox<oshape.width;ox++) {
	double* col = &patches[(size_t(oy-row0)*oshape.width+ox)*ksize];
	for(int dy=0;dy<kernel_h;dy++) {
	  int iy = oy*stride_h+dy-pad_top;
	  for(int dx=0;dx<kernel_w;dx++) {
	    int ix = ox*stride_w+dx-pad_left;
	    if(iy<0 || iy>=in.height || ix<0 || ix>=in.width) {
	      std::fill(col,col+in_channels,0.);
	    } else {
	      const double* src = &in.data[(size_t(iy)*in.width+ix)*in_channels];
	      std::copy(src,src+in_channels,col);
	    }
	    col += in_channels;
	  }
	}
      }
    }

    // out(filters x npix) += weights(filters x ksize) * patches(ksize x npix), column major
    openhsv::gemm(filters,npix,ksize,1.,&weights[0],&patches[0],1.,
		  &out.data[size_t(row0)*oshape.width*filters]);
  }

  apply_activation(activation,out);
  return out;
}

// BatchNormalization
// ==================================================

openhsv::BatchNormalization::BatchNormalization(int channels, const double& i_epsilon) :
  epsilon(i_epsilon)
{
  if(channels<0) OPENHSV_ERROR("invalid number of channels " << channels);
  gamma.resize(channels,1.);
  beta.resize(channels,0.);
  moving_mean.resize(channels,0.);
  moving_variance.resize(channels,1.);
}

void openhsv::BatchNormalization::Check() const {
  size_t nc = gamma.size();
  if(beta.size()!=nc || moving_mean.size()!=nc || moving_variance.size()!=nc)
    OPENHSV_ERROR("BatchNormalization parameter vectors have different sizes");
  if(epsilon<0) OPENHSV_ERROR("BatchNormalization epsilon must be positive, got " << epsilon);
  for(size_t c=0;c<nc;c++)
    if(!(moving_variance[c]+epsilon>0))
      OPENHSV_ERROR("BatchNormalization channel " << c << " has variance " << moving_variance[c] << " with epsilon " << epsilon);
}

openhsv::Shape openhsv::BatchNormalization::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Check();
  size_t nc = gamma.size();
  if(inputs[0].channels != int(nc))
    OPENHSV_ERROR("BatchNormalization expects " << nc << " channel(s), got " << inputs[0].channels);
  return inputs[0];
}

openhsv::tensor openhsv::BatchNormalization::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  OutputShape(std::vector<Shape>(1,inputs[0]->shape()));
  tensor out = *inputs[0];
  size_t nc = gamma.size();
  unbls::vector_double scale(nc),offset(nc);
  for(size_t c=0;c<nc;c++) {
    scale[c]  = gamma[c]/sqrt(moving_variance[c]+epsilon);
    offset[c] = beta[c]-scale[c]*moving_mean[c];
  }
  for(size_t p=0;p<out.n_pixels();p++) {
    double* x = &out.data[p*nc];
    for(size_t c=0;c<nc;c++) x[c] = scale[c]*x[c]+offset[c];
  }
  return out;
}

// Activation
// ==================================================

openhsv::Activation::Activation(const std::string& i_activation) :
  activation(i_activation)
{
  Check();
}

void openhsv::Activation::Check() const {
  if(!is_known_activation(activation))
    OPENHSV_ERROR("unknown activation '" << activation << "'");
}

openhsv::Shape openhsv::Activation::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Check();
  return inputs[0];
}

openhsv::tensor openhsv::Activation::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  tensor out = *inputs[0];
  apply_activation(activation,out);
  return out;
}

// MaxPooling2D
// ==================================================

openhsv::MaxPooling2D::MaxPooling2D(int i_pool_h, int i_pool_w) :
  pool_h(i_pool_h), pool_w(i_pool_w)
{
  Check();
}

void openhsv::MaxPooling2D::Check() const {
  if(pool_h<1 || pool_w<1) OPENHSV_ERROR("invalid pool size " << pool_h << "x" << pool_w);
}

openhsv::Shape openhsv::MaxPooling2D::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Check();
  const Shape& in = inputs[0];
  Shape out(in.height/pool_h,in.width/pool_w,in.channels);
  if(out.height==0 || out.width==0)
    OPENHSV_ERROR("MaxPooling2D input " << in << " smaller than pool " << pool_h << "x" << pool_w);
  return out;
}

openhsv::tensor openhsv::MaxPooling2D::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  const tensor& in = *inputs[0];
  tensor out(OutputShape(std::vector<Shape>(1,in.shape())));
  for(int y=0;y<out.height;y++)
    for(int x=0;x<out.width;x++)
      for(int c=0;c<out.channels;c++) {
	double m = in(y*pool_h,x*pool_w,c);
	for(int dy=0;dy<pool_h;dy++)
	  for(int dx=0;dx<pool_w;dx++)
	    m = std::max(m,in(y*pool_h+dy,x*pool_w+dx,c));
	out(y,x,c) = m;
      }
  return out;
}

// UpSampling2D
// ==================================================

openhsv::UpSampling2D::UpSampling2D(int i_size_h, int i_size_w) :
  size_h(i_size_h), size_w(i_size_w)
{
  Check();
}

void openhsv::UpSampling2D::Check() const {
  if(size_h<1 || size_w<1) OPENHSV_ERROR("invalid upsampling size " << size_h << "x" << size_w);
}

openhsv::Shape openhsv::UpSampling2D::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Check();
  const Shape& in = inputs[0];
  return Shape(in.height*size_h,in.width*size_w,in.channels);
}

openhsv::tensor openhsv::UpSampling2D::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  const tensor& in = *inputs[0];
  tensor out(OutputShape(std::vector<Shape>(1,in.shape())));
  size_t nc = size_t(in.channels);
  for(int y=0;y<out.height;y++)
    for(int x=0;x<out.width;x++) {
      const double* src = &in.data[(size_t(y/size_h)*in.width+x/size_w)*nc];
      std::copy(src,src+nc,&out.data[(size_t(y)*out.width+x)*nc]);
    }
  return out;
}

// Concatenate
// ==================================================

openhsv::Shape openhsv::Concatenate::OutputShape(const std::vector<openhsv::Shape>& inputs) const {
  CheckNumberOfInputs(inputs.size());
  Shape out = inputs[0];
  for(size_t k=1;k<inputs.size();k++) {
    if(inputs[k].height!=out.height || inputs[k].width!=out.width)
      OPENHSV_ERROR("Concatenate inputs have different sizes " << inputs[0] << " and " << inputs[k]);
    out.channels += inputs[k].channels;
  }
  return out;
}

openhsv::tensor openhsv::Concatenate::Forward(const std::vector<const openhsv::tensor*>& inputs) const {
  std::vector<Shape> shapes;
  for(size_t k=0;k<inputs.size();k++) shapes.push_back(inputs[k]->shape());
  tensor out(OutputShape(shapes));
  for(size_t p=0;p<out.n_pixels();p++) {
    double* dest = &out.data[p*out.channels];
    for(size_t k=0;k<inputs.size();k++) {
      size_t nc = size_t(inputs[k]->channels);
      const double* src = &inputs[k]->data[p*nc];
      dest = std::copy(src,src+nc,dest);
    }
  }
  return out;
}
