#include <iostream>

#include "openhsv_message.h"
#include "openhsv_linalg.h"
#include "openhsv_test_utils.h"

using namespace std;

int main() {
  
  unbls::vector_double x(3),y(3);
  x[0]=1; x[1]=2; x[2]=3;
  y[0]=4; y[1]=5; y[2]=6;
  
  TEST_CLOSE(openhsv::dot(x,y),32,1e-12);
  TEST_CLOSE(openhsv::sum(x),6,1e-12);
  
  openhsv::axpy(2,x,y);
  TEST_CLOSE(y[0],6,1e-12);
  TEST_CLOSE(y[2],12,1e-12);
  
  double minv,maxv;
  openhsv::minmax(y,minv,maxv);
  TEST_CLOSE(minv,6,0);
  TEST_CLOSE(maxv,12,0);
  TEST_THROWS(openhsv::minmax(unbls::vector_double(),minv,maxv));
  TEST_THROWS(openhsv::dot(x,unbls::vector_double(2)));
  
  // A = [1 2 3 ; 4 5 6]
  unbls::matrix_double A(2,3);
  A(0,0)=1; A(0,1)=2; A(0,2)=3;
  A(1,0)=4; A(1,1)=5; A(1,2)=6;
  
  unbls::vector_double Ax(2);
  openhsv::gemv(1,A,x,0,Ax);
  TEST_CLOSE(Ax[0],14,1e-12);
  TEST_CLOSE(Ax[1],32,1e-12);
  
  // B = A^T
  unbls::matrix_double B(3,2);
  for(int i=0;i<2;i++) for(int j=0;j<3;j++) B(j,i)=A(i,j);
  
  unbls::matrix_double C(2,2);
  C(0,0)=1;
  openhsv::gemm(1,A,B,1,C);
  TEST_CLOSE(C(0,0),15,1e-12);
  TEST_CLOSE(C(0,1),32,1e-12);
  TEST_CLOSE(C(1,0),32,1e-12);
  TEST_CLOSE(C(1,1),77,1e-12);
  
  unbls::matrix_double D(3,3);
  TEST_THROWS(openhsv::gemm(1,A,A,0,D));
  
  return test_result("openhsv_test_linalg");
}
