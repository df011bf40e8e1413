#include <iostream>
#include <sstream>
#include <fstream>
#include <cstdio>

#include "openhsv_message.h"
#include "openhsv_layer.h"
#include "openhsv_network.h"
#include "openhsv_network_io.h"
#include "openhsv_test_utils.h"

using namespace std;

static openhsv::tensor filled(int h, int w, int c, double value) {
  openhsv::tensor t(h,w,c);
  for(size_t k=0;k<t.data.size();k++) t.data[k]=value;
  return t;
}

static openhsv::tensor forward(const openhsv::Layer& layer, const openhsv::tensor& in) {
  return layer.Forward(vector<const openhsv::tensor*>(1,&in));
}

// small encoder/decoder with one skip connection
static openhsv::Network_p small_unet() {
  openhsv::Network_p net(new openhsv::Network(1,"small_unet"));
  
  openhsv::Conv2D* c1 = new openhsv::Conv2D(3,3,1,2,"same","relu");
  for(int dy=0;dy<3;dy++)
    for(int dx=0;dx<3;dx++) {
      c1->Weight(dy,dx,0,0) = 0.1*(dy+1);
      c1->Weight(dy,dx,0,1) = -0.05*(dx+1);
    }
  c1->bias[1] = 0.2;
  int n1 = net->Add("conv1",openhsv::Layer_p(c1));
  
  openhsv::BatchNormalization* bn = new openhsv::BatchNormalization(2);
  bn->moving_variance[0]=4; bn->moving_variance[1]=0.25;
  bn->moving_mean[0]=0.1;
  net->Add("bn1",openhsv::Layer_p(bn));
  net->Add("pool1",openhsv::Layer_p(new openhsv::MaxPooling2D(2,2)));
  net->Add("conv2",openhsv::Layer_p(new openhsv::Conv2D(3,3,2,2,"same","relu")));
  int n2 = net->Add("up1",openhsv::Layer_p(new openhsv::UpSampling2D(2,2)));
  
  vector<int> skip; skip.push_back(n1); skip.push_back(n2);
  net->Add("concat",openhsv::Layer_p(new openhsv::Concatenate()),skip);
  
  openhsv::Conv2D* out = new openhsv::Conv2D(1,1,4,1,"same","sigmoid");
  out->Weight(0,0,0,0)=1; out->Weight(0,0,1,0)=-2; out->Weight(0,0,2,0)=0.5; out->Weight(0,0,3,0)=0.3;
  out->bias[0]=-0.1;
  net->Add("output",openhsv::Layer_p(out));
  return net;
}

// replaces the first occurrence of a string in a text file
static bool edit_file(const string& filename, const string& from, const string& to) {
  ifstream is(filename.c_str());
  stringstream content; content << is.rdbuf();
  is.close();
  string text = content.str();
  size_t pos = text.find(from);
  if(pos==string::npos) return false;
  text.replace(pos,from.size(),to);
  ofstream os(filename.c_str());
  os << text;
  os.close();
  return true;
}

int main() {
  
  openhsv_set_verbose(true);
  
  // 1x1 convolution is an affine map of the pixel value
  {
    openhsv::Network net(1,"affine");
    openhsv::Conv2D* conv = new openhsv::Conv2D(1,1,1,1);
    conv->Weight(0,0,0,0)=2;
    conv->bias[0]=1;
    net.Add("conv",openhsv::Layer_p(conv));
    
    openhsv::image_data img(3,2);
    for(size_t k=0;k<img.data.size();k++) img.data[k]=k;
    openhsv::image_data out = net.Predict(img);
    TEST_CHECK(out.same_shape(img));
    for(size_t k=0;k<img.data.size();k++) TEST_CLOSE(out.data[k],2*k+1,1e-12);
    TEST_CHECK(net.NParams()==2);
    TEST_CHECK(net.NNodes()==2);
  }
  
  // 3x3 'same' convolution of ones counts the neighbours inside the image
  {
    openhsv::Conv2D conv(3,3,1,1);
    for(size_t k=0;k<conv.weights.size();k++) conv.weights[k]=1;
    openhsv::tensor out = forward(conv,filled(3,4,1,1));
    TEST_CHECK(out.shape()==openhsv::Shape(3,4,1));
    TEST_CLOSE(out(1,1,0),9,1e-12);
    TEST_CLOSE(out(1,2,0),9,1e-12);
    TEST_CLOSE(out(0,1,0),6,1e-12);
    TEST_CLOSE(out(1,0,0),6,1e-12);
    TEST_CLOSE(out(0,0,0),4,1e-12);
    TEST_CLOSE(out(2,3,0),4,1e-12);
  }
  
  // 'valid' padding and strides
  {
    openhsv::Conv2D valid(3,3,1,1,"valid");
    for(size_t k=0;k<valid.weights.size();k++) valid.weights[k]=1;
    openhsv::tensor out = forward(valid,filled(4,5,1,2));
    TEST_CHECK(out.shape()==openhsv::Shape(2,3,1));
    TEST_CLOSE(out(1,2,0),18,1e-12);
    TEST_THROWS(forward(valid,filled(2,5,1,1)));
    
    openhsv::Conv2D strided(3,3,1,1,"same","linear",2,2);
    for(size_t k=0;k<strided.weights.size();k++) strided.weights[k]=1;
    out = forward(strided,filled(5,5,1,1));
    TEST_CHECK(out.shape()==openhsv::Shape(3,3,1));
    TEST_CLOSE(out(0,0,0),4,1e-12);
    TEST_CLOSE(out(1,1,0),9,1e-12);
    TEST_CLOSE(out(2,2,0),4,1e-12);
  }
  
  // channel mixing follows the (kh,kw,cin,cout) weight order
  {
    openhsv::Conv2D conv(1,1,2,2);
    conv.Weight(0,0,0,0)=1;  conv.Weight(0,0,1,0)=10;
    conv.Weight(0,0,0,1)=-1; conv.Weight(0,0,1,1)=0;
    conv.bias[1]=5;
    openhsv::tensor in(2,2,2);
    for(int y=0;y<2;y++)
      for(int x=0;x<2;x++) {
	in(y,x,0)=y+2*x;
	in(y,x,1)=0.5;
      }
    openhsv::tensor out = forward(conv,in);
    TEST_CHECK(out.shape()==openhsv::Shape(2,2,2));
    TEST_CLOSE(out(1,1,0),3+5,1e-12);
    TEST_CLOSE(out(1,1,1),5-3,1e-12);
    TEST_CLOSE(out(0,1,0),2+5,1e-12);
    TEST_THROWS(forward(conv,filled(2,2,1,0)));
  }
  
  // pooling and upsampling
  {
    openhsv::tensor in(4,4,1);
    for(int y=0;y<4;y++) for(int x=0;x<4;x++) in(y,x,0)=y*4+x;
    openhsv::MaxPooling2D pool(2,2);
    openhsv::tensor pooled = forward(pool,in);
    TEST_CHECK(pooled.shape()==openhsv::Shape(2,2,1));
    TEST_CLOSE(pooled(0,0,0),5,0);
    TEST_CLOSE(pooled(1,1,0),15,0);
    TEST_THROWS(forward(pool,filled(1,4,1,0)));
    
    openhsv::UpSampling2D up(2,2);
    openhsv::tensor upsampled = forward(up,pooled);
    TEST_CHECK(upsampled.shape()==openhsv::Shape(4,4,1));
    TEST_CLOSE(upsampled(0,1,0),5,0);
    TEST_CLOSE(upsampled(3,2,0),15,0);
  }
  
  // concatenation along channels
  {
    openhsv::tensor a = filled(2,3,1,1);
    openhsv::tensor b = filled(2,3,2,7);
    openhsv::Concatenate concat;
    vector<const openhsv::tensor*> in; in.push_back(&a); in.push_back(&b);
    openhsv::tensor out = concat.Forward(in);
    TEST_CHECK(out.shape()==openhsv::Shape(2,3,3));
    TEST_CLOSE(out(1,2,0),1,0);
    TEST_CLOSE(out(1,2,2),7,0);
    
    openhsv::tensor c = filled(1,3,1,0);
    in.push_back(&c);
    TEST_THROWS(concat.Forward(in));
    TEST_THROWS(concat.Forward(vector<const openhsv::tensor*>(1,&a)));
  }
  
  // batch normalization and activations
  {
    openhsv::BatchNormalization bn(1,0);
    bn.gamma[0]=2; bn.beta[0]=1; bn.moving_mean[0]=3; bn.moving_variance[0]=4;
    openhsv::tensor out = forward(bn,filled(1,1,1,5));
    TEST_CLOSE(out(0,0,0),3,1e-12);
    
    openhsv::tensor t = filled(1,2,1,0);
    t(0,1,0)=-3;
    openhsv::apply_activation("sigmoid",t);
    TEST_CLOSE(t(0,0,0),0.5,1e-12);
    
    openhsv::tensor s(1,1,2);
    s(0,0,0)=1; s(0,0,1)=3;
    openhsv::apply_activation("softmax",s);
    TEST_CLOSE(s(0,0,0)+s(0,0,1),1,1e-12);
    TEST_CLOSE(s(0,0,1)/s(0,0,0),std::exp(2.),1e-9);
    
    openhsv::tensor r = filled(1,1,1,-2);
    openhsv::apply_activation("relu",r);
    TEST_CLOSE(r(0,0,0),0,0);
    
    TEST_THROWS(openhsv::apply_activation("swish",r));
    TEST_THROWS(openhsv::Activation("swish"));
  }
  
  // graph validation
  {
    openhsv::Network net(1);
    TEST_THROWS(net.Add("conv",openhsv::Layer_p()));
    TEST_THROWS(net.Add("",openhsv::Layer_p(new openhsv::Activation("relu"))));
    TEST_THROWS(net.Add("input",openhsv::Layer_p(new openhsv::Activation("relu"))));
    TEST_THROWS(net.Add("conv",openhsv::Layer_p(new openhsv::Conv2D(3,3,1,1)),vector<int>(1,3)));
    TEST_THROWS(net.Add("cat",openhsv::Layer_p(new openhsv::Concatenate()),vector<int>(1,0)));
    TEST_THROWS(net.Add("in2",openhsv::Layer_p(new openhsv::InputLayer(1))));
    
    openhsv::Conv2D conv(3,3,1,1);
    TEST_THROWS(conv.SetWeights(unbls::vector_double(8),unbls::vector_double(1)));
    TEST_THROWS(openhsv::Conv2D(3,3,1,1,"full"));
    
    net.Add("conv",openhsv::Layer_p(new openhsv::Conv2D(3,3,1,2)));
    TEST_CHECK(net.NodeIndex("conv")==1);
    TEST_CHECK(net.NodeIndex("none")==-1);
    TEST_THROWS(net.GetNode(5));
    // two output channels cannot be squeezed into an image
    TEST_THROWS(net.Predict(openhsv::image_data(8,8)));
    TEST_THROWS(net.Predict(openhsv::image_data(8,8,3)));
  }
  
  // full graph with a skip connection
  {
    openhsv::Network_p net = small_unet();
    TEST_CHECK(net->NNodes()==8);
    TEST_CHECK(net->OutputShape(openhsv::Shape(16,8,1))==openhsv::Shape(16,8,1));
    TEST_THROWS(net->OutputShape(openhsv::Shape(15,8,1)));
    
    stringstream summary;
    net->Summary(summary,8,16);
    TEST_CHECK(summary.str().find("Concatenate")!=string::npos);
    TEST_CHECK(summary.str().find("total number of parameters")!=string::npos);
    if(openhsv_is_verbose()) cout << summary.str();
    
    openhsv::image_data img(8,16);
    for(size_t j=0;j<16;j++) for(size_t i=0;i<8;i++) img(i,j) = ((i+j)%3)-1.;
    openhsv::image_data out = net->Predict(img);
    TEST_CHECK(out.same_shape(img));
    for(size_t k=0;k<out.data.size();k++) TEST_CHECK(out.data[k]>0 && out.data[k]<1);
    
    // xml archive keeps the graph and the weights
    const string filename = "openhsv_test_network.xml";
    openhsv::write_network_xml(*net,filename);
    openhsv::Network_p copy = openhsv::read_network(filename);
    TEST_CHECK(copy->name=="small_unet");
    TEST_CHECK(copy->NNodes()==net->NNodes());
    TEST_CHECK(copy->NParams()==net->NParams());
    openhsv::image_data out2 = copy->Predict(img);
    for(size_t k=0;k<out.data.size();k++) TEST_CLOSE(out2.data[k],out.data[k],1e-9);
    std::remove(filename.c_str());
    
    TEST_THROWS(openhsv::read_network("openhsv_test_network.h5"));
    TEST_THROWS(openhsv::read_network("does_not_exist.xml"));
  }
  
  // parameters read from an archive are validated like constructor arguments
  {
    const string filename = "openhsv_test_network_edited.xml";
    
    openhsv::Network pool_net(1,"pool");
    pool_net.Add("pool",openhsv::Layer_p(new openhsv::MaxPooling2D(2,2)));
    openhsv::write_network_xml(pool_net,filename);
    TEST_CHECK(edit_file(filename,"<pool_h>2</pool_h>","<pool_h>0</pool_h>"));
    TEST_THROWS(openhsv::read_network(filename));
    
    openhsv::Network conv_net(1,"conv");
    conv_net.Add("conv",openhsv::Layer_p(new openhsv::Conv2D(3,3,1,1)));
    openhsv::write_network_xml(conv_net,filename);
    TEST_CHECK(edit_file(filename,"<stride_h>1</stride_h>","<stride_h>0</stride_h>"));
    TEST_THROWS(openhsv::read_network(filename));
    
    openhsv::write_network_xml(conv_net,filename);
    TEST_CHECK(edit_file(filename,"<activation>linear</activation>","<activation>swish</activation>"));
    TEST_THROWS(openhsv::read_network(filename));
    
    openhsv::Network up_net(1,"up");
    up_net.Add("up",openhsv::Layer_p(new openhsv::UpSampling2D(2,2)));
    openhsv::write_network_xml(up_net,filename);
    TEST_CHECK(edit_file(filename,"<size_w>2</size_w>","<size_w>0</size_w>"));
    TEST_THROWS(openhsv::read_network(filename));
    
    openhsv::Network input_net(1,"input");
    input_net.Add("relu",openhsv::Layer_p(new openhsv::Activation("relu")));
    openhsv::write_network_xml(input_net,filename);
    TEST_CHECK(edit_file(filename,"<channels>1</channels>","<channels>0</channels>"));
    TEST_THROWS(openhsv::read_network(filename));
    
    // unedited archive still reads
    openhsv::write_network_xml(up_net,filename);
    openhsv::Network_p copy = openhsv::read_network(filename);
    TEST_CHECK(copy->OutputShape(openhsv::Shape(4,4,1))==openhsv::Shape(8,8,1));
    
    std::remove(filename.c_str());
  }
  
  // layers changed after being added are checked before use
  {
    openhsv::Network net(1);
    openhsv::MaxPooling2D* pool = new openhsv::MaxPooling2D(2,2);
    net.Add("pool",openhsv::Layer_p(pool));
    pool->pool_w = 0;
    TEST_THROWS(net.Predict(openhsv::image_data(8,8)));
    
    openhsv::BatchNormalization bn(1,0);
    bn.moving_variance[0] = 0;
    TEST_THROWS(forward(bn,filled(1,1,1,1)));
  }
  
  return test_result("openhsv_test_network");
}
