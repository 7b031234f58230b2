// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_VALIDATION_ERROR_HXX
#define HLS_VALIDATION_ERROR_HXX

#include <stdexcept>
#include <string>
#include <string_view>

namespace Hls {

enum class ValidationErrorCode {
	/**
	 * The tag name did not match the record it was offered to.
	 */
	UNEXPECTED_TAG_NAME,

	/**
	 * The tag value had a different shape than expected (for
	 * example a plain value where an attribute list is
	 * required).
	 */
	UNEXPECTED_VALUE_TYPE,

	MISSING_REQUIRED_ATTRIBUTE,

	/**
	 * Parsing into this tag is not implemented.
	 */
	NOT_IMPLEMENTED,

	ERROR_EXTRACTING_TAG_VALUE,

	ERROR_EXTRACTING_ATTRIBUTE_LIST_VALUE,

	INVALID_ENUMERATED_STRING,
};

/**
 * A syntactically valid tag could not be converted into its typed
 * record.  If the cause was a #SyntaxError or a parser exception, it
 * is nested inside.
 */
class ValidationError : public std::runtime_error {
	ValidationErrorCode code;

	/**
	 * The attribute which caused the error; may be empty.
	 */
	std::string attribute_name;

public:
	ValidationError(ValidationErrorCode _code, const std::string &msg,
			std::string_view _attribute_name={})
		:std::runtime_error(msg), code(_code),
		 attribute_name(_attribute_name) {}

	ValidationErrorCode GetCode() const noexcept {
		return code;
	}

	std::string_view GetAttributeName() const noexcept {
		return attribute_name;
	}

	static ValidationError UnexpectedTagName(std::string_view name);

	static ValidationError UnexpectedValueType(std::string_view expected);

	static ValidationError MissingRequiredAttribute(std::string_view name);

	static ValidationError NotImplemented() {
		return {ValidationErrorCode::NOT_IMPLEMENTED,
			"Parsing into this tag is not implemented"};
	}

	static ValidationError ErrorExtractingTagValue() {
		return {ValidationErrorCode::ERROR_EXTRACTING_TAG_VALUE,
			"Failed to extract tag value"};
	}

	static ValidationError ErrorExtractingAttributeListValue(std::string_view name);

	static ValidationError InvalidEnumeratedString() {
		return {ValidationErrorCode::INVALID_ENUMERATED_STRING,
			"Invalid enumerated string in value"};
	}
};

} // namespace Hls

#endif
