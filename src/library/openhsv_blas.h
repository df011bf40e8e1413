#ifndef OPENHSV_BLAS_H_
#define OPENHSV_BLAS_H_

// reference (Fortran) BLAS interface, all arguments by address

extern "C" {
  
  double ddot_(const int *n, const double *x, const int *incx, const double *y, const int *incy);
  
  void daxpy_(const int *n, const double *alpha, const double *x, const int *incx,
	      double *y, const int *incy);

  void dgemv_(const char *trans, const int *m, const int *n, const double *alpha,
	      const double *a, const int *lda, const double *x, const int *incx,
	      const double *beta, double *y, const int *incy);
  
  void dgemm_(const char *transa, const char *transb, const int *m, const int *n, const int *k,
	      const double *alpha, const double *a, const int *lda, const double *b, const int *ldb,
	      const double *beta, double *c, const int *ldc);
  
}

#endif
