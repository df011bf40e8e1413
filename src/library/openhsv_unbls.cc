#include <openhsv_unbls.h>
#include <openhsv_message.h>

// matrix methods
unbls::matrix::matrix() 
{
 _nrows=0;
 _ncols=0;
}

// matrix_double methods
unbls::matrix_double::matrix_double() : unbls::matrix() {}
unbls::matrix_double::matrix_double(size_t nrows, size_t ncols) :
  unbls::matrix()
{
  resize(nrows, ncols);
}
unbls::matrix_double::matrix_double(size_t nrows, size_t ncols, const std::vector<double>& i_vals) :
  unbls::matrix()
{
  if(i_vals.size() != nrows*ncols)
    OPENHSV_ERROR("matrix_double: " << i_vals.size() << " values for a " << nrows << "x" << ncols << " matrix");
  _nrows = nrows;
  _ncols = ncols;
  vals = i_vals;
}
void unbls::matrix_double::resize(size_t nrows, size_t ncols) 
{
  _nrows = nrows;
  _ncols = ncols;
  vals.resize(_nrows*_ncols);
  unbls::zero(vals);
}
double* unbls::matrix_double::address()
{
  return vals.data();
}
const double* unbls::matrix_double::address() const
{
  return vals.data();
}
