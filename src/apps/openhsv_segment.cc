#include <openhsv_segment_main.h>

int main ( int argc, char *argv[] ) {
  return openhsv_segment_main(argc,argv);
}
