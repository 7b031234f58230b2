// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ValidationError.hxx"

#include <fmt/format.h>

namespace Hls {

ValidationError
ValidationError::UnexpectedTagName(std::string_view name)
{
	return {ValidationErrorCode::UNEXPECTED_TAG_NAME,
		fmt::format("Unexpected tag name '{}'", name)};
}

ValidationError
ValidationError::UnexpectedValueType(std::string_view expected)
{
	return {ValidationErrorCode::UNEXPECTED_VALUE_TYPE,
		fmt::format("Unexpected value type, expected {}", expected)};
}

ValidationError
ValidationError::MissingRequiredAttribute(std::string_view name)
{
	return {ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
		fmt::format("Required attribute {} is missing", name),
		name};
}

ValidationError
ValidationError::ErrorExtractingAttributeListValue(std::string_view name)
{
	return {ValidationErrorCode::ERROR_EXTRACTING_ATTRIBUTE_LIST_VALUE,
		fmt::format("Failed to extract value of attribute {}", name),
		name};
}

} // namespace Hls
