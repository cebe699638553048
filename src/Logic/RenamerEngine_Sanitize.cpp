#include "RenamerEngine.h"

#include <string>
#include <string_view>

namespace
{
// Characters that may not appear in a basename on Windows, Linux or macOS
constexpr std::string_view ReservedChars = R"(<>:"/\|?*)";

inline bool IsDroppedChar(unsigned char c) noexcept
{
	return c <= 31 || ReservedChars.find(static_cast<char>(c)) != std::string_view::npos;
}
} // namespace

// Turns a raw metadata label into "<stem><extension>" that is legal as a single basename.
// Oversized labels are rejected rather than truncated
SanitizeResult RenamerEngine::SanitizeLabel(const std::string &rawLabel, const std::string &extension)
{
	SanitizeResult result;
	result.labelLength = CountCodePoints(rawLabel);

	if (result.labelLength > MaxLabelCodePoints)
	{
		result.status = SanitizeStatus::LabelTooLong;
		return result;
	}

	std::string reduced;
	reduced.reserve(rawLabel.size());
	for (unsigned char c : rawLabel)
	{
		if (!IsDroppedChar(c))
		{
			reduced.push_back(static_cast<char>(c));
		}
	}

	// Collapse every run of dots to a single dot so no ".." survives
	std::size_t pos;
	while ((pos = reduced.find("..")) != std::string::npos)
	{
		reduced.erase(pos, 1);
	}

	reduced = TrimName(reduced);
	if (reduced.empty() || extension.size() >= MaxNameBytes)
	{
		result.status = SanitizeStatus::EmptyLabel;
		return result;
	}

	// Stem and extension together must fit the basename limit
	reduced = TrimName(TruncateUtf8(reduced, MaxNameBytes - extension.size()));
	if (reduced.empty())
	{
		result.status = SanitizeStatus::EmptyLabel;
		return result;
	}

	result.name = reduced + extension;
	result.status = SanitizeStatus::Ok;
	return result;
}
