#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "arbor/error.h"

using namespace arbor;

TEST(ErrorTest, ClassifiesErrnoValues) {
    EXPECT_EQ(classify({ENOENT, std::generic_category()}), ErrorKind::NotFound);
    EXPECT_EQ(classify({ENOTDIR, std::generic_category()}), ErrorKind::NotFound);
    EXPECT_EQ(classify({EACCES, std::generic_category()}), ErrorKind::AccessDenied);
    EXPECT_EQ(classify({EPERM, std::generic_category()}), ErrorKind::AccessDenied);
    EXPECT_EQ(classify({EIO, std::generic_category()}), ErrorKind::IOError);
    EXPECT_EQ(classify({ENOTEMPTY, std::generic_category()}), ErrorKind::IOError);
}

TEST(ErrorTest, FromErrnoKeepsPathAndCode) {
    const auto error = Error::from_errno(EACCES, "stat", "/srv/secret");
    EXPECT_EQ(error.kind(), ErrorKind::AccessDenied);
    EXPECT_EQ(error.path(), std::filesystem::path{"/srv/secret"});
    EXPECT_EQ(error.code(), std::errc::permission_denied);
    EXPECT_NE(std::string{error.what()}.find("/srv/secret"), std::string::npos);
}

TEST(ErrorTest, PartialFailureRemembersCause) {
    const auto cause = Error::from_errno(EIO, "unlink", "/srv/x");
    const auto partial = Error::partial(cause, 4);
    EXPECT_EQ(partial.kind(), ErrorKind::PartialFailure);
    EXPECT_EQ(partial.cause(), ErrorKind::IOError);
    EXPECT_EQ(partial.completed(), 4u);
    EXPECT_EQ(partial.path(), cause.path());
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::InvalidPath), "InvalidPath");
    EXPECT_EQ(to_string(ErrorKind::PartialFailure), "PartialFailure");
}
