#include <iomanip>
#include <sstream>

#include <openhsv_network.h>
#include <openhsv_message.h>

using namespace std;

openhsv::Network::Network(int input_channels, const std::string& i_name) :
  name(i_name)
{
  Node input;
  input.name = "input";
  input.layer = Layer_p(new InputLayer(input_channels));
  nodes.push_back(input);
}

int openhsv::Network::Add(const std::string& node_name, openhsv::Layer_p layer, const std::vector<int>& inputs) {
  if(!layer) OPENHSV_ERROR("cannot add node '" << node_name << "' without layer");
  if(node_name.empty()) OPENHSV_ERROR("node name cannot be empty");
  if(NodeIndex(node_name)>=0) OPENHSV_ERROR("node '" << node_name << "' already exists");
  if(layer->NInputs()==0) OPENHSV_ERROR("only node 0 can be an input layer");
  layer->Check();
  for(size_t k=0;k<inputs.size();k++) {
    if(inputs[k]<0 || inputs[k]>=int(nodes.size()))
      OPENHSV_ERROR("node '" << node_name << "' input " << inputs[k] << " is not an existing node");
  }
  int expected = layer->NInputs();
  if(expected<0 ? inputs.size()<2 : int(inputs.size())!=expected)
    OPENHSV_ERROR("node '" << node_name << "' (" << layer->Type() << ") cannot consume " << inputs.size() << " input(s)");
  
  Node node;
  node.name = node_name;
  node.layer = layer;
  node.inputs = inputs;
  nodes.push_back(node);
  return int(nodes.size())-1;
}

int openhsv::Network::Add(const std::string& node_name, openhsv::Layer_p layer) {
  return Add(node_name,layer,vector<int>(1,int(nodes.size())-1));
}

int openhsv::Network::NodeIndex(const std::string& node_name) const {
  for(size_t n=0;n<nodes.size();n++)
    if(nodes[n].name==node_name) return int(n);
  return -1;
}

const openhsv::Node& openhsv::Network::GetNode(size_t index) const {
  if(index>=nodes.size()) OPENHSV_ERROR("no node " << index << " in network of " << nodes.size() << " nodes");
  return nodes[index];
}

int openhsv::Network::InputChannels() const {
  Check();
  return static_cast<const InputLayer*>(nodes[0].layer.get())->channels;
}

size_t openhsv::Network::NParams() const {
  size_t n=0;
  for(size_t k=0;k<nodes.size();k++)
    if(nodes[k].layer) n += nodes[k].layer->NParams();
  return n;
}

void openhsv::Network::Check() const {
  if(nodes.empty()) OPENHSV_ERROR("network has no node");
  if(!nodes[0].layer || nodes[0].layer->Type()!="InputLayer")
    OPENHSV_ERROR("first node of network must be an InputLayer");
  nodes[0].layer->Check();
  for(size_t n=1;n<nodes.size();n++) {
    const Node& node = nodes[n];
    if(!node.layer) OPENHSV_ERROR("node " << n << " '" << node.name << "' has no layer");
    if(node.layer->NInputs()==0) OPENHSV_ERROR("node " << n << " '" << node.name << "' is a second input layer");
    for(size_t k=0;k<node.inputs.size();k++)
      if(node.inputs[k]<0 || node.inputs[k]>=int(n))
	OPENHSV_ERROR("node " << n << " '" << node.name << "' consumes node " << node.inputs[k] << " which is not an earlier node");
    int expected = node.layer->NInputs();
    if(expected<0 ? node.inputs.size()<2 : int(node.inputs.size())!=expected)
      OPENHSV_ERROR("node " << n << " '" << node.name << "' (" << node.layer->Type() << ") has " << node.inputs.size() << " input(s)");
    node.layer->Check();
  }
}

std::vector<openhsv::Shape> openhsv::Network::NodeShapes(const openhsv::Shape& input) const {
  Check();
  vector<Shape> shapes(nodes.size());
  shapes[0] = nodes[0].layer->OutputShape(vector<Shape>(1,input));
  for(size_t n=1;n<nodes.size();n++) {
    vector<Shape> in;
    for(size_t k=0;k<nodes[n].inputs.size();k++) in.push_back(shapes[nodes[n].inputs[k]]);
    shapes[n] = nodes[n].layer->OutputShape(in);
  }
  return shapes;
}

openhsv::Shape openhsv::Network::OutputShape(const openhsv::Shape& input) const {
  return NodeShapes(input).back();
}

openhsv::tensor openhsv::Network::Predict(const openhsv::tensor& input) const {
  
  Check();
  if(input.height<1 || input.width<1) OPENHSV_ERROR("empty network input " << input.shape());
  
  // index of the last node consuming each node
  vector<size_t> last_use(nodes.size(),0);
  for(size_t n=1;n<nodes.size();n++)
    for(size_t k=0;k<nodes[n].inputs.size();k++)
      last_use[nodes[n].inputs[k]] = n;

  vector<tensor> results(nodes.size());
  results[0] = nodes[0].layer->Forward(vector<const tensor*>(1,&input));

  for(size_t n=1;n<nodes.size();n++) {
    vector<const tensor*> in;
    for(size_t k=0;k<nodes[n].inputs.size();k++) in.push_back(&results[nodes[n].inputs[k]]);
    OPENHSV_DEBUG("node " << n << " " << nodes[n].name << " (" << nodes[n].layer->Type() << ")");
    results[n] = nodes[n].layer->Forward(in);
    
    for(size_t k=0;k<nodes[n].inputs.size();k++) {
      int i = nodes[n].inputs[k];
      if(last_use[i]==n) results[i].clear();
    }
  }
  return results.back();
}

openhsv::image_data openhsv::Network::Predict(const openhsv::image_data& input) const {
  if(input.Nc()!=1) OPENHSV_ERROR("network prediction expects a single channel image, got " << input.Nc() << " channels");
  tensor out = Predict(image_to_tensor(input));
  if(out.channels!=1) OPENHSV_ERROR("network output has " << out.channels << " channels, expected 1");
  return tensor_to_image(out);
}

void openhsv::Network::Summary(std::ostream& os, int width, int height) const {
  Check();
  vector<Shape> shapes = NodeShapes(Shape(height,width,InputChannels()));
  os << "Network " << name << endl;
  os << setw(4) << "#" << " " << setw(24) << left << "name" << setw(20) << "type"
     << setw(22) << "output shape" << right << setw(12) << "params" << "  inputs" << endl;
  for(size_t n=0;n<nodes.size();n++) {
    stringstream shape; shape << shapes[n];
    stringstream inputs;
    for(size_t k=0;k<nodes[n].inputs.size();k++) inputs << " " << nodes[nodes[n].inputs[k]].name;
    os << setw(4) << n << " " << setw(24) << left << nodes[n].name << setw(20) << nodes[n].layer->Type()
       << setw(22) << shape.str() << right << setw(12) << nodes[n].layer->NParams() << " " << inputs.str() << endl;
  }
  os << "total number of parameters = " << NParams() << endl;
}
