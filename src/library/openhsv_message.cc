#include "openhsv_message.h"

static bool static_openhsv_debug = false;
static bool static_openhsv_verbose = false;
static std::string static_message_prefix = "";

void openhsv_set_message_prefix(const std::string &mess) { static_message_prefix = " "+mess;}
void openhsv_set_debug(bool yesorno) { static_openhsv_debug=yesorno;}
void openhsv_set_verbose(bool yesorno) { static_openhsv_verbose=yesorno;}
bool openhsv_is_verbose() {return static_openhsv_verbose;}
bool openhsv_is_debug() {return static_openhsv_debug;}

void openhsv_debug(const std::string& mess) {
  if(openhsv_is_debug()) {
    std::cout << "DEBUG" << static_message_prefix << " " << mess << std::endl;
  }
}
void openhsv_info(const std::string& mess) {
  if(openhsv_is_verbose()) {
    std::cout << "INFO" << static_message_prefix << " " << mess << std::endl;
  }
}
void openhsv_warning(const std::string& mess) {
  std::cerr << "WARNING" << static_message_prefix << " " << mess << std::endl;
}

// the exception itself is raised by OPENHSV_ERROR
void openhsv_error(const std::string& mess) {
  std::cerr << "ERROR" << static_message_prefix << " " << mess << std::endl;
}
