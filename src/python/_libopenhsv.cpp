#include <string>
#include <sstream>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include <openhsv_message.h>
#include <openhsv_image_data.h>
#include <openhsv_network.h>
#include <openhsv_network_io.h>
#include <openhsv_analysis.h>
#include <openhsv_segment_main.h>

namespace hsv = openhsv;
namespace py  = pybind11;

typedef py::array_t<double, py::array::c_style | py::array::forcecast> nparray_double;

// (N,H,W) gray or (N,H,W,C) frames
std::vector<hsv::image_data> nparray2frames(nparray_double frames){

  auto prop = frames.request();
  if(prop.ndim != 3 && prop.ndim != 4)
    throw std::invalid_argument("frames must have shape (N,H,W) or (N,H,W,C)");

  size_t nframes   = prop.shape[0];
  size_t nrows     = prop.shape[1];
  size_t ncols     = prop.shape[2];
  size_t nchannels = (prop.ndim==4) ? prop.shape[3] : 1;
  const double *vals = (const double*) prop.ptr;

  std::vector<hsv::image_data> images;
  for(size_t f=0;f<nframes;f++) {
    images.push_back(hsv::image_data(ncols,nrows,nchannels));
    hsv::image_data& img = images.back();
    const double* src = vals + f*nrows*ncols*nchannels;
    for(size_t j=0;j<nrows;j++)
      for(size_t i=0;i<ncols;i++)
	for(size_t c=0;c<nchannels;c++)
	  img(i,j,c) = src[(j*ncols+i)*nchannels+c];
  }
  return images;
}

// (H,W) array of a single channel image
py::array_t<double> image2nparray(const hsv::image_data& img){
  py::array_t<double> arr({img.Ny(),img.Nx()});
  auto r = arr.mutable_unchecked<2>();
  for(size_t j=0;j<img.Ny();j++)
    for(size_t i=0;i<img.Nx();i++)
      r(j,i) = img(i,j);
  return arr;
}

py::list segmentation2list(const std::vector<hsv::image_data>& segmentation){
  py::list maps;
  for(size_t f=0;f<segmentation.size();f++) maps.append(image2nparray(segmentation[f]));
  return maps;
}

PYBIND11_MODULE(_libopenhsv, m) {
    m.doc() = R"(
    Internal wrapper around compiled openhsv code.

    Networks are wrapped in a shared_ptr and shared between the python
    objects and the analysis that uses them.
    )";

    py::register_exception<hsv::exception>(m, "OpenHSVError");

    m.def("set_verbose", &openhsv_set_verbose);
    m.def("set_debug",   &openhsv_set_debug);

    m.def("run", [](std::vector<std::string> args) {
	return hsv::segment_main(args);
      }, R"(runs openhsv_segment, args[0] is the program name)");

    m.def("read_network", &hsv::read_network, py::arg("filename"));

    // classes

    py::class_ <hsv::Network, hsv::Network_p> (m, "Network", R"(Segmentation network)")
      .def(py::init<int, std::string>(), py::arg("input_channels")=1, py::arg("name")="")
      .def_readwrite("name", &hsv::Network::name)
      .def("n_nodes",  &hsv::Network::NNodes)
      .def("n_params", &hsv::Network::NParams)
      .def("write", [](const hsv::Network& net, std::string filename) {
	  hsv::write_network_xml(net,filename);
	})
      .def("summary", [](const hsv::Network& net, int width, int height) {
	  std::stringstream ss;
	  net.Summary(ss,width,height);
	  return ss.str();
	}, py::arg("width")=256, py::arg("height")=256)
      .def("predict", [](const hsv::Network& net, nparray_double image) {
	  if(image.ndim() != 2) throw std::invalid_argument("image must have shape (H,W)");
	  auto r = image.unchecked<2>();
	  hsv::image_data img(r.shape(1),r.shape(0));
	  for(py::ssize_t j=0;j<r.shape(0);j++)
	    for(py::ssize_t i=0;i<r.shape(1);i++)
	      img(i,j) = r(j,i);
	  return image2nparray(net.Predict(img));
	});

    py::class_ <hsv::Analysis> (m, "Analysis", R"(Full automatic glottis segmentation)")
      .def(py::init<hsv::Network_p>(), py::arg("model"))
      .def_readwrite("multiple_of", &hsv::Analysis::multiple_of)
      .def_readwrite("cval",        &hsv::Analysis::cval)
      .def("segment_sequence", [](hsv::Analysis& analysis, nparray_double frames, bool normalize, bool reinit) {
	  std::vector<hsv::image_data> images = nparray2frames(frames);
	  py::gil_scoped_release release;
	  analysis.segment_sequence(images,normalize,reinit);
	}, py::arg("ims"), py::arg("normalize")=true, py::arg("reinit")=true)
      .def("gaw", [](const hsv::Analysis& analysis) { return analysis.gaw(); })
      .def("gaw_preview", &hsv::Analysis::gaw_preview, py::arg("n")=40)
      .def("segmentation", [](const hsv::Analysis& analysis) {
	  return segmentation2list(analysis.segmentations());
	})
      .def("get", [](const hsv::Analysis& analysis) {
	  py::dict result;
	  result["gaw"] = analysis.gaw();
	  result["segmentation"] = segmentation2list(analysis.segmentations());
	  return result;
	})
      .def("clear", &hsv::Analysis::clear);
}
