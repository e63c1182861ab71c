#include "symptomops/cli/router.hpp"

int main(int argc, char** argv) {
  return symptomops::cli::Dispatch(argc, argv);
}
