#include <openhsv_analysis.h>
#include <openhsv_preprocess.h>
#include <openhsv_linalg.h>
#include <openhsv_message.h>

using namespace std;

openhsv::Analysis::Analysis(openhsv::Network_p i_model) :
  multiple_of(32), cval(0)
{
  set_model(i_model);
}

void openhsv::Analysis::set_model(openhsv::Network_p i_model) {
  if(!i_model) OPENHSV_ERROR("Analysis needs a network");
  i_model->Check();
  model_ = i_model;
}

const openhsv::Network& openhsv::Analysis::model() const {
  return *model_;
}

void openhsv::Analysis::clear() {
  segmentations_.clear();
  gaw_.clear();
}

openhsv::image_data openhsv::Analysis::segment(const openhsv::image_data& frame) {
  
  // process image to fit the network
  image_data processed = divpad(rgb2gray(frame),multiple_of,cval);
  
  image_data pr = model_->Predict(processed);
  
  gaw_.push_back(openhsv::sum(pr.data));
  segmentations_.push_back(pr);
  
  OPENHSV_DEBUG("frame " << gaw_.size()-1 << " " << frame.Nx() << "x" << frame.Ny()
		<< " segmentation " << pr.Nx() << "x" << pr.Ny() << " area " << gaw_.back());
  
  return segmentations_.back();
}

void openhsv::Analysis::segment_sequence(const std::vector<openhsv::image_data>& frames, bool normalize, bool reinit) {
  
  if(reinit) clear();
  
  size_t nframes = frames.size();
  OPENHSV_INFO("segmenting " << nframes << " frames");
  
  size_t step = max(size_t(1),nframes/10);
  
  for(size_t f=0;f<nframes;f++) {
    
    if(normalize) 
      segment(openhsv::normalize(frames[f]));
    else
      segment(frames[f]);
    
    if((f+1)%step==0 || f+1==nframes) {
      OPENHSV_INFO("segmented " << f+1 << "/" << nframes << " frames (" << int(100.*(f+1)/nframes) << "%)");
    }
    
    if(progress_) progress_(f,nframes);
  }
}

openhsv::AnalysisResult openhsv::Analysis::get() const {
  AnalysisResult result;
  result.gaw = gaw_;
  result.segmentation = segmentations_;
  return result;
}

unbls::vector_double openhsv::Analysis::gaw_preview(size_t n) const {
  size_t first = (gaw_.size()>n) ? gaw_.size()-n : 0;
  return unbls::vector_double(gaw_.begin()+first,gaw_.end());
}
