#ifndef OPENHSV_ANALYSIS__H
#define OPENHSV_ANALYSIS__H

#include <vector>
#include <functional>

#include <openhsv_image_data.h>
#include <openhsv_network.h>

namespace openhsv {

  class AnalysisResult {
  public :
    unbls::vector_double gaw; // glottal area waveform, one value per frame
    std::vector<image_data> segmentation;
  };
  
  /*!
    fully automatic glottis segmentation of an endoscopic video, frame by
    frame, with a neural network. keeps the segmentation map of each frame
    and the glottal area waveform (GAW), the sum of the segmentation map.
   */
  class Analysis {

  public :

    typedef std::function<void(size_t,size_t)> progress_callback;
    
    int multiple_of; // frame dimensions are padded to a multiple of this
    double cval; // value of padded pixels
    
    Analysis(Network_p i_model);
    
    void set_model(Network_p i_model);
    const Network& model() const;
    
    //! called after each frame of segment_sequence with (frame index, number of frames)
    void set_progress_callback(progress_callback callback) { progress_ = callback; }
    
    /*!
      segments an image sequence frame by frame,
      normalize : 0..255 -> -1..1 before segmentation,
      reinit : drops previous segmentation information.
     */
    void segment_sequence(const std::vector<image_data>& frames, bool normalize=true, bool reinit=true);
    
    //! segments one frame (1 or 3 channels), returns a copy of its segmentation map
    image_data segment(const image_data& frame);
    
    AnalysisResult get() const;
    const unbls::vector_double& gaw() const { return gaw_; }
    const std::vector<image_data>& segmentations() const { return segmentations_; }
    size_t n_frames() const { return gaw_.size(); }
    
    //! last n values of the GAW
    unbls::vector_double gaw_preview(size_t n=40) const;
    
    void clear();
    
  private :
    
    Network_p model_;
    progress_callback progress_;
    std::vector<image_data> segmentations_;
    unbls::vector_double gaw_;
    
  };
  
}

#endif
