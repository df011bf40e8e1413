#ifndef OPENHSV_LINALG__H
#define OPENHSV_LINALG__H

#include <openhsv_unbls.h>

namespace openhsv {
    
  // ! scalar product
  double dot(const unbls::vector_double&, const unbls::vector_double&);
  
  // ! y += a*x
  void axpy(const double&, const unbls::vector_double&, unbls::vector_double&);
  
  // ! y := alpha*A*x + beta*y
  void gemv(const double &alpha,  const unbls::matrix_double &A,  const unbls::vector_double& x, const double &beta, unbls::vector_double& y);
  
  // ! C := alpha*A*B + beta*C
  void gemm(const double& alpha, const unbls::matrix_double &A, const unbls::matrix_double &B, const double& beta, unbls::matrix_double &C);
  
  // ! C := alpha*A*B + beta*C on raw column major storage, A is m x k, B is k x n, C is m x n
  void gemm(int m, int n, int k, const double& alpha, const double* A, const double* B, const double& beta, double* C);
  
  double sum(const unbls::vector_double& v);
  
  void minmax(const unbls::vector_double& v, double& minv, double& maxv);
  
}
#endif
