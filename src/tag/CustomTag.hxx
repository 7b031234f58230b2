// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_CUSTOM_TAG_HXX
#define HLS_CUSTOM_TAG_HXX

#include "DirtyLineTag.hxx"
#include "WritableTag.hxx"

#include <memory>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * A tag type implemented by the application.
 */
class CustomTag {
public:
	virtual ~CustomTag() noexcept = default;

	/**
	 * Describe the current state of this tag, to be rendered
	 * after it was modified.
	 */
	virtual WritableTag ToWritableTag() const = 0;
};

/**
 * Passed to ParseLine() by applications which implement their own
 * tag types.  It is consulted before the built-in tag names, so it
 * may replace built-in records as well.
 */
class CustomTagProvider {
public:
	virtual ~CustomTagProvider() noexcept = default;

	/**
	 * Is this provider responsible for the given name (the part
	 * after "#EXT", e.g. "-X-EXAMPLE")?
	 */
	[[gnu::pure]]
	virtual bool IsKnownName(std::string_view name) const noexcept = 0;

	/**
	 * Construct a tag instance.  This is only called for names
	 * claimed by IsKnownName().
	 *
	 * Throws #ValidationError on error; if this method is not
	 * overridden, it throws NOT_IMPLEMENTED.
	 */
	virtual std::unique_ptr<CustomTag> Parse(const ParsedTag &tag) const;
};

/**
 * Owns a #CustomTag and caches its output line.  Read access leaves
 * the original line intact; after mutable access, the line is
 * rendered from CustomTag::ToWritableTag().
 */
class CustomTagAccess final : public DirtyLineTag {
	std::unique_ptr<CustomTag> tag;

public:
	CustomTagAccess(std::unique_ptr<CustomTag> &&_tag,
			std::string_view original_input) noexcept
		:DirtyLineTag(original_input), tag(std::move(_tag)) {}

	/**
	 * Wrap a tag which was not parsed from an input line.
	 */
	explicit CustomTagAccess(std::unique_ptr<CustomTag> &&_tag)
		:tag(std::move(_tag)) {
		InitOutputLine();
	}

	const CustomTag &Get() const noexcept {
		return *tag;
	}

	/**
	 * Obtain a mutable reference; this assumes the caller will
	 * modify the tag, which marks the output line dirty.
	 */
	CustomTag &GetMutable() noexcept {
		MarkDirty();
		return *tag;
	}

	/**
	 * Downcast to the application's type.
	 *
	 * @return nullptr if the tag is of a different type
	 */
	template<typename T>
	const T *As() const noexcept {
		return dynamic_cast<const T *>(tag.get());
	}

	template<typename T>
	T *AsMutable() noexcept {
		auto *t = dynamic_cast<T *>(tag.get());
		if (t != nullptr)
			MarkDirty();
		return t;
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
