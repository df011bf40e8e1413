#ifndef OPENHSV_EXCEPTION__H
#define OPENHSV_EXCEPTION__H

#include <exception>
#include <string>

namespace openhsv {

  class exception : public std::exception {
    
  public :
    
    exception ( const char * msg, const char * file = 0, int line = 0 );
    ~exception ( ) throw() { }
    const char* what() const throw();
    
  private :
    
    std::string msg_;
    
  };
  
}

#define OPENHSV_THROW(msg) throw openhsv::exception ( msg, __FILE__, __LINE__ )

#endif
