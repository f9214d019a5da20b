#include <aws/core/Aws.h>
#include <gtest/gtest.h>

// Stream events draw their ids from the SDK's crypto-backed UUID generator,
// so the SDK must be initialised around every suite.
int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  Aws::SDKOptions options;
  Aws::InitAPI(options);
  const int rc = RUN_ALL_TESTS();
  Aws::ShutdownAPI(options);
  return rc;
}
