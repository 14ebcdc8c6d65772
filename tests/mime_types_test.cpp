#include <gtest/gtest.h>

#include "mime_types.hpp"

using namespace sfs;

TEST(MimeTypes, KnownExtensions) {
    EXPECT_EQ(mime_type_for("/srv/public/index.html"), "text/html; charset=utf-8");
    EXPECT_EQ(mime_type_for("style.css"), "text/css; charset=utf-8");
    EXPECT_EQ(mime_type_for("app.js"), "application/javascript; charset=utf-8");
    EXPECT_EQ(mime_type_for("logo.png"), "image/png");
    EXPECT_EQ(mime_type_for("report.pdf"), "application/pdf");
}

TEST(MimeTypes, ExtensionMatchIsCaseInsensitive) {
    EXPECT_EQ(mime_type_for("PHOTO.JPG"), "image/jpeg");
    EXPECT_EQ(mime_type_for("Index.HTML"), "text/html; charset=utf-8");
}

TEST(MimeTypes, UnknownOrMissingExtensionIsBinary) {
    EXPECT_EQ(mime_type_for("archive.xyz"), "application/octet-stream");
    EXPECT_EQ(mime_type_for("Makefile"), "application/octet-stream");
}
