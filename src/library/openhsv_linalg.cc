#include <openhsv_linalg.h>
#include <openhsv_message.h>
#include <openhsv_blas.h>

// all calls to the Fortran BLAS are in this file

static const int ione = 1;

double openhsv::dot(const unbls::vector_double& x, const unbls::vector_double& y) {
  if(x.size() != y.size()) OPENHSV_ERROR("dot: size mismatch " << x.size() << " " << y.size());
  int n = int(x.size());
  if(n==0) return 0;
  return ddot_(&n, x.data(), &ione, y.data(), &ione);
}
  
void openhsv::axpy(const double &alpha, const unbls::vector_double& x, unbls::vector_double& y) {
  if(x.size() != y.size()) OPENHSV_ERROR("axpy: size mismatch " << x.size() << " " << y.size());
  int n = int(x.size());
  if(n==0) return;
  daxpy_(&n, &alpha, x.data(), &ione, y.data(), &ione);
}

void openhsv::gemv(const double &alpha,  const unbls::matrix_double &A,  const unbls::vector_double& x, const double &beta, unbls::vector_double& y) {
  if(A.size2() != x.size() || A.size1() != y.size())
    OPENHSV_ERROR("gemv: incompatible sizes A=" << A.size1() << "x" << A.size2() << " x=" << x.size() << " y=" << y.size());
  int m = int(A.size1());
  int n = int(A.size2());
  if(m==0 || n==0) return;
  char trans = 'N';
  dgemv_(&trans, &m, &n, &alpha, A.address(), &m, x.data(), &ione, &beta, y.data(), &ione);
}

void openhsv::gemm(const double& alpha, const unbls::matrix_double &A, const unbls::matrix_double &B, const double& beta, unbls::matrix_double &C) {
  if(A.size2() != B.size1() || C.size1() != A.size1() || C.size2() != B.size2())
    OPENHSV_ERROR("gemm: incompatible sizes A=" << A.size1() << "x" << A.size2()
		  << " B=" << B.size1() << "x" << B.size2()
		  << " C=" << C.size1() << "x" << C.size2());
  openhsv::gemm(int(A.size1()), int(B.size2()), int(A.size2()), alpha, A.address(), B.address(), beta, C.address());
}

void openhsv::gemm(int m, int n, int k, const double& alpha, const double* A, const double* B, const double& beta, double* C) {
  if(m==0 || n==0) return;
  char trans = 'N';
  int lda = m;
  int ldb = (k>0) ? k : 1;
  int ldc = m;
  dgemm_(&trans, &trans, &m, &n, &k, &alpha, A, &lda, B, &ldb, &beta, C, &ldc);
}

double openhsv::sum(const unbls::vector_double& v) {
  double s = 0;
  for(unbls::vector_double::const_iterator it=v.begin(); it!=v.end(); ++it) s += *it;
  return s;
}

// min and max of vector
void openhsv::minmax(const unbls::vector_double& v, double& minv, double& maxv) {
  if(v.empty()) OPENHSV_ERROR("minmax of empty vector");
  unbls::vector_double::const_iterator it=v.begin();
  minv=maxv=(*it);
  for(; it!=v.end() ; ++it) {
    if(*it<minv) minv=*it;
    if(*it>maxv) maxv=*it;
  }
}
