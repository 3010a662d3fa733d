/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * test_error.cpp - Unit tests for errors and last-error translation
 */

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "libswitchtecpp/common/error.hpp"
#include "libswitchtecpp/device/last_error.hpp"

#include "fake_boundary.hpp"

using namespace libswitchtecpp;
using libswitchtecpp::test::FakeBoundary;

// ─────────────────────────────────────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────────────────────────────────────

TEST(ErrorTest, KindAndMessageStored)
{
	Error err(ErrorKind::NotFound, "No such device");

	EXPECT_EQ(err.Kind(), ErrorKind::NotFound);
	EXPECT_EQ(err.Message(), "No such device");
	EXPECT_STREQ(err.what(), "No such device");
}

TEST(ErrorTest, DerivesFromRuntimeError)
{
	EXPECT_THROW(throw Error(ErrorKind::OperationFailed, "test"), std::runtime_error);
}

TEST(ErrorTest, KindNames)
{
	EXPECT_STREQ(error_kind_name(ErrorKind::NotFound), "NotFound");
	EXPECT_STREQ(error_kind_name(ErrorKind::InvalidData), "InvalidData");
	EXPECT_STREQ(error_kind_name(ErrorKind::OperationFailed), "OperationFailed");
	EXPECT_STREQ(error_kind_name(ErrorKind::Unknown), "Unknown");
}

TEST(ErrorTest, KindStreams)
{
	std::ostringstream os;
	os << ErrorKind::InvalidData;

	EXPECT_EQ(os.str(), "InvalidData");
}

// ─────────────────────────────────────────────────────────────────────────────
// translate_last_error
// ─────────────────────────────────────────────────────────────────────────────

TEST(TranslateLastErrorTest, UsesIndicatorMessageAndRequestedKind)
{
	FakeBoundary boundary;
	boundary.last_error = "No such file or directory";

	Error err = translate_last_error(boundary, ErrorKind::NotFound);

	EXPECT_EQ(err.Kind(), ErrorKind::NotFound);
	EXPECT_EQ(err.Message(), "No such file or directory");
	EXPECT_EQ(boundary.error_reads, 1u);
}

TEST(TranslateLastErrorTest, NullIndicatorIsUnknown)
{
	FakeBoundary boundary;
	boundary.last_error = nullptr;

	Error err = translate_last_error(boundary, ErrorKind::OperationFailed);

	EXPECT_EQ(err.Kind(), ErrorKind::Unknown);
	EXPECT_EQ(err.Message(), UnknownErrorMessage);
}

TEST(TranslateLastErrorTest, UndecodableIndicatorIsUnknown)
{
	FakeBoundary boundary;
	const char garbage[] = { 'e', '\xfe', '\xff', '\0' };
	boundary.last_error = garbage;

	EXPECT_NO_THROW({
		Error err = translate_last_error(boundary, ErrorKind::OperationFailed);

		EXPECT_EQ(err.Kind(), ErrorKind::Unknown);
		EXPECT_EQ(err.Message(), "Unknown error");
	});
}

TEST(TranslateLastErrorTest, MakesNoOtherBoundaryCall)
{
	FakeBoundary boundary;
	boundary.last_error = "Timer expired";

	translate_last_error(boundary, ErrorKind::OperationFailed);

	EXPECT_EQ(boundary.calls, 0u);
	EXPECT_EQ(boundary.error_reads, 1u);
}
