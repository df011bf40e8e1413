#include <iostream>
#include <vector>

#include "openhsv_message.h"
#include "openhsv_layer.h"
#include "openhsv_network.h"
#include "openhsv_analysis.h"
#include "openhsv_preprocess.h"
#include "openhsv_test_utils.h"

using namespace std;

// dark pixels (glottis) -> 1, bright pixels (tissue) -> 0
static openhsv::Network_p threshold_network() {
  openhsv::Network_p net(new openhsv::Network(1,"threshold"));
  openhsv::Conv2D* conv = new openhsv::Conv2D(1,1,1,1,"same","sigmoid");
  conv->Weight(0,0,0,0) = -10;
  net->Add("glottis",openhsv::Layer_p(conv));
  return net;
}

// bright frame with a dark rectangle of f rows by 10 columns
static openhsv::image_data frame(size_t f, size_t nx=32, size_t ny=32, size_t nc=1) {
  openhsv::image_data img(nx,ny,nc);
  for(size_t c=0;c<nc;c++)
    for(size_t j=0;j<ny;j++)
      for(size_t i=0;i<nx;i++)
	img(i,j,c) = (j<f && i<10) ? 0 : 255;
  return img;
}

static double expected_area(size_t f, size_t npix=32*32) {
  double glottis = 1./(1.+std::exp(-10.));
  double tissue  = 1./(1.+std::exp(10.));
  return 10*f*glottis+(npix-10*f)*tissue;
}

int main() {
  
  openhsv_set_verbose(true);
  
  openhsv::Network_p net = threshold_network();
  
  vector<openhsv::image_data> frames;
  for(size_t f=0;f<5;f++) frames.push_back(frame(f*3));
  
  // GAW is the area of the segmentation map of each frame
  {
    openhsv::Analysis analysis(net);
    size_t ncalls=0, last_index=0, last_total=0;
    analysis.set_progress_callback([&](size_t index, size_t total) {
	ncalls++; last_index=index; last_total=total;
      });
    analysis.segment_sequence(frames);
    
    TEST_CHECK(ncalls==5);
    TEST_CHECK(last_index==4 && last_total==5);
    TEST_CHECK(analysis.n_frames()==5);
    
    openhsv::AnalysisResult result = analysis.get();
    TEST_CHECK(result.gaw.size()==5);
    TEST_CHECK(result.segmentation.size()==5);
    for(size_t f=0;f<5;f++) {
      TEST_CHECK(result.segmentation[f].Nx()==32 && result.segmentation[f].Ny()==32);
      TEST_CLOSE(result.gaw[f],expected_area(f*3),1e-6);
      double area=0;
      for(size_t k=0;k<result.segmentation[f].data.size();k++) area += result.segmentation[f].data[k];
      TEST_CLOSE(result.gaw[f],area,1e-9);
    }
    TEST_CHECK(result.gaw[4]>result.gaw[1]);
    TEST_CLOSE(result.segmentation[4](0,0),1,1e-4);
    TEST_CLOSE(result.segmentation[4](20,0),0,1e-4);
    
    // live plot window
    unbls::vector_double preview = analysis.gaw_preview(3);
    TEST_CHECK(preview.size()==3);
    TEST_CLOSE(preview[0],result.gaw[2],0);
    TEST_CLOSE(preview[2],result.gaw[4],0);
    TEST_CHECK(analysis.gaw_preview().size()==5);
    
    // appending to previous results
    analysis.segment_sequence(frames,true,false);
    TEST_CHECK(analysis.n_frames()==10);
    TEST_CHECK(analysis.segmentations().size()==10);
    TEST_CLOSE(analysis.gaw()[7],analysis.gaw()[2],1e-12);
    TEST_CHECK(ncalls==10);
    
    analysis.segment_sequence(frames);
    TEST_CHECK(analysis.n_frames()==5);
    
    analysis.clear();
    TEST_CHECK(analysis.n_frames()==0);
    TEST_CHECK(analysis.segmentations().empty());
    TEST_CHECK(analysis.gaw_preview().empty());
  }
  
  // frames already in -1..1
  {
    vector<openhsv::image_data> normalized;
    for(size_t f=0;f<frames.size();f++) {
      normalized.push_back(frames[f]);
      for(size_t k=0;k<normalized[f].data.size();k++) normalized[f].data[k] = normalized[f].data[k]/127.5-1;
    }
    openhsv::Analysis analysis(net);
    analysis.segment_sequence(normalized,false);
    for(size_t f=0;f<5;f++) TEST_CLOSE(analysis.gaw()[f],expected_area(f*3),1e-6);
  }
  
  // RGB frames are converted to gray
  {
    openhsv::Analysis analysis(net);
    vector<openhsv::image_data> rgb;
    rgb.push_back(frame(6,32,32,3));
    analysis.segment_sequence(rgb);
    TEST_CLOSE(analysis.gaw()[0],expected_area(6),1e-6);
    
    vector<openhsv::image_data> two_channels(1,openhsv::image_data(32,32,2));
    TEST_THROWS(analysis.segment_sequence(two_channels));
  }
  
  // padded frames, the map keeps the padded size
  {
    openhsv::Analysis analysis(net);
    openhsv::image_data map = analysis.segment(openhsv::normalize(frame(4,40,20)));
    TEST_CHECK(map.Nx()==64 && map.Ny()==32);
    // padding pixels have cval=0 -> sigmoid(0)
    TEST_CLOSE(map(0,0),0.5,1e-12);
    TEST_CLOSE(map(12,6),1,1e-4);
    TEST_CLOSE(analysis.gaw()[0],expected_area(4,800)+0.5*(64*32-800),1e-6);
    
    analysis.multiple_of = 8;
    analysis.cval = 1;
    openhsv::image_data map8 = analysis.segment(openhsv::normalize(frame(4,40,20)));
    TEST_CHECK(map8.Nx()==40 && map8.Ny()==24);
    TEST_CLOSE(map8(0,0),0,1e-4);
    TEST_CHECK(analysis.n_frames()==2);
    
    // maps returned earlier stay valid while more frames are segmented
    for(size_t f=0;f<20;f++) analysis.segment(openhsv::normalize(frame(f,32,32)));
    TEST_CHECK(analysis.n_frames()==22);
    TEST_CHECK(map.Nx()==64 && map.Ny()==32);
    TEST_CLOSE(map(0,0),0.5,1e-12);
    TEST_CHECK(map.data==analysis.segmentations()[0].data);
  }
  
  openhsv::Network_p no_network;
  TEST_THROWS(openhsv::Analysis bad(no_network));
  
  return test_result("openhsv_test_analysis");
}
