#include <sstream>

#include <openhsv_exception.h>
#include <openhsv_message.h>

openhsv::exception::exception ( const char * msg, const char * file, int line ) : std::exception() {
  std::ostringstream o;
  o << msg;
  if ( openhsv_is_debug() && file ) {
    o << " (at line " << line << " of file " << file << ")";
  }
  msg_ = o.str();
}

const char* openhsv::exception::what() const throw() {
  return msg_.c_str();
}
