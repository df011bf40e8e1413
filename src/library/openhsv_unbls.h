#ifndef OPENHSV_UNBLS__H
#define OPENHSV_UNBLS__H

#include <vector>
#include <cstddef>
#include <ostream>
#include <algorithm>

namespace unbls {

  typedef std::vector < int >     vector_int;
  typedef std::vector < double >  vector_double;

  // matrix class
  class matrix {
    
  protected :
    size_t _nrows;
    size_t _ncols;
    
  public :

    matrix ();
    
    size_t size1() const { return _nrows; }
    size_t size2() const { return _ncols; }
      
  };
  
  // column major, as expected by BLAS
  class matrix_double : public matrix {

  public :
    
    std::vector < double >  vals;
    
    matrix_double ( );
    matrix_double ( size_t nrows, size_t ncols);
    matrix_double ( size_t nrows, size_t ncols, const unbls::vector_double& i_data);
    
    void resize( size_t nrows, size_t ncols);
    double* address();
    const double* address() const;
    
    double& operator()(const int i, const int j) { return vals[i+j*_nrows]; }    
    const double& operator()(const int i, const int j) const { return vals[i+j*_nrows]; }
      
  };
  
  template <class T>
  void zero(std::vector<T>& v){
    std::fill(v.begin(),v.end(),0);
  }

  inline void zero(matrix_double &m){
    zero(m.vals);
  }

}

template < class T >
inline std::ostream& operator << (std::ostream& os, const std::vector<T>& v) 
{
    os << "[";
    for (size_t i = 0; i<v.size(); i++)
    {
        os << " " << v[i];
    }
    os << " ]";
    return os;
}

#endif
