#ifndef OPENHSV_LAYER__H
#define OPENHSV_LAYER__H

#include <vector>
#include <string>
#include <memory>

#include <boost/serialization/access.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/base_object.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/assume_abstract.hpp>
#include <boost/serialization/export.hpp>

#include <openhsv_tensor.h>

namespace openhsv {

  //! applies "linear", "relu", "sigmoid", "tanh" or "softmax" (over channels) in place
  void apply_activation(const std::string& activation, tensor& t);
  bool is_known_activation(const std::string& activation);

  class Layer {

    friend class boost::serialization::access;

  public :

    Layer() {}
    virtual ~Layer() {}

    virtual std::string Type() const = 0;

    //! number of inputs, -1 for any number >= 2
    virtual int NInputs() const { return 1; }
    virtual size_t NParams() const { return 0; }

    virtual Shape OutputShape(const std::vector<Shape>& inputs) const = 0;
    virtual tensor Forward(const std::vector<const tensor*>& inputs) const = 0;

    //! validates the parameters, also after reading from an archive
    virtual void Check() const {}

  protected :

    void CheckNumberOfInputs(size_t n) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
    }

  };

  typedef std::shared_ptr<Layer> Layer_p;

  //! placeholder for the network input, its forward pass is a copy
  class InputLayer : public Layer {

    friend class boost::serialization::access;

  public :

    int channels;

    InputLayer(int i_channels=1) : channels(i_channels) {}

    std::string Type() const { return "InputLayer"; }
    int NInputs() const { return 0; }
    void Check() const;
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
      ar & BOOST_SERIALIZATION_NVP(channels);
    }
  };

  /*!
    2D convolution with bias and activation.
    weights are in the keras order (kernel_h, kernel_w, in_channels, filters),
    padding is "same" or "valid".
   */
  class Conv2D : public Layer {

    friend class boost::serialization::access;

  public :

    int kernel_h;
    int kernel_w;
    int in_channels;
    int filters;
    int stride_h;
    int stride_w;
    std::string padding;
    std::string activation;
    unbls::vector_double weights;
    unbls::vector_double bias;

    Conv2D();
    Conv2D(int i_kernel_h, int i_kernel_w, int i_in_channels, int i_filters,
	   const std::string& i_padding="same", const std::string& i_activation="linear",
	   int i_stride_h=1, int i_stride_w=1);

    void SetWeights(const unbls::vector_double& i_weights, const unbls::vector_double& i_bias);
    double& Weight(int dy, int dx, int ci, int co) { return weights[((size_t(dy)*kernel_w+dx)*in_channels+ci)*filters+co]; }

    std::string Type() const { return "Conv2D"; }
    size_t NParams() const { return weights.size()+bias.size(); }
    void Check() const;
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    void PaddingBefore(const Shape& in, int& pad_top, int& pad_left) const;

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
      ar & BOOST_SERIALIZATION_NVP(kernel_h);
      ar & BOOST_SERIALIZATION_NVP(kernel_w);
      ar & BOOST_SERIALIZATION_NVP(in_channels);
      ar & BOOST_SERIALIZATION_NVP(filters);
      ar & BOOST_SERIALIZATION_NVP(stride_h);
      ar & BOOST_SERIALIZATION_NVP(stride_w);
      ar & BOOST_SERIALIZATION_NVP(padding);
      ar & BOOST_SERIALIZATION_NVP(activation);
      ar & BOOST_SERIALIZATION_NVP(weights);
      ar & BOOST_SERIALIZATION_NVP(bias);
    }
  };

  //! inference form, y = gamma*(x-mean)/sqrt(variance+epsilon)+beta per channel
  class BatchNormalization : public Layer {

    friend class boost::serialization::access;

  public :

    unbls::vector_double gamma;
    unbls::vector_double beta;
    unbls::vector_double moving_mean;
    unbls::vector_double moving_variance;
    double epsilon;

    BatchNormalization(int channels=0, const double& i_epsilon=1.e-3);

    int Channels() const { return int(gamma.size()); }
    std::string Type() const { return "BatchNormalization"; }
    size_t NParams() const { return 4*gamma.size(); }
    void Check() const;
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
      ar & BOOST_SERIALIZATION_NVP(gamma);
      ar & BOOST_SERIALIZATION_NVP(beta);
      ar & BOOST_SERIALIZATION_NVP(moving_mean);
      ar & BOOST_SERIALIZATION_NVP(moving_variance);
      ar & BOOST_SERIALIZATION_NVP(epsilon);
    }
  };

  class Activation : public Layer {

    friend class boost::serialization::access;

  public :

    std::string activation;

    Activation(const std::string& i_activation="linear");

    std::string Type() const { return "Activation"; }
    void Check() const;
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
      ar & BOOST_SERIALIZATION_NVP(activation);
    }
  };

  //! max over pool_h x pool_w blocks, stride equal to the pool size, "valid" padding
  class MaxPooling2D : public Layer {

    friend class boost::serialization::access;

  public :

    int pool_h;
    int pool_w;

    MaxPooling2D(int i_pool_h=2, int i_pool_w=2);

    std::string Type() const { return "MaxPooling2D"; }
    void Check() const;
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
      ar & BOOST_SERIALIZATION_NVP(pool_h);
      ar & BOOST_SERIALIZATION_NVP(pool_w);
    }
  };

  //! nearest neighbour
  class UpSampling2D : public Layer {

    friend class boost::serialization::access;

  public :

    int size_h;
    int size_w;

    UpSampling2D(int i_size_h=2, int i_size_w=2);

    std::string Type() const { return "UpSampling2D"; }
    void Check() const;
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
      ar & BOOST_SERIALIZATION_NVP(size_h);
      ar & BOOST_SERIALIZATION_NVP(size_w);
    }
  };

  //! concatenation along the channel axis
  class Concatenate : public Layer {

    friend class boost::serialization::access;

  public :

    Concatenate() {}

    std::string Type() const { return "Concatenate"; }
    int NInputs() const { return -1; }
    Shape OutputShape(const std::vector<Shape>& inputs) const;
    tensor Forward(const std::vector<const tensor*>& inputs) const;

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & boost::serialization::make_nvp("Layer",boost::serialization::base_object<Layer>(*this));
    }
  };

}

BOOST_SERIALIZATION_ASSUME_ABSTRACT(openhsv::Layer)

BOOST_CLASS_EXPORT_KEY(openhsv::InputLayer)
BOOST_CLASS_EXPORT_KEY(openhsv::Conv2D)
BOOST_CLASS_EXPORT_KEY(openhsv::BatchNormalization)
BOOST_CLASS_EXPORT_KEY(openhsv::Activation)
BOOST_CLASS_EXPORT_KEY(openhsv::MaxPooling2D)
BOOST_CLASS_EXPORT_KEY(openhsv::UpSampling2D)
BOOST_CLASS_EXPORT_KEY(openhsv::Concatenate)

#endif
