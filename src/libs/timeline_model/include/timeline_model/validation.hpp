#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace timeline_model {

// Each check returns the first problem found, or nullopt when the record is usable.
// `path` prefixes the reported field name.

std::optional<ValidationError> validate_duration(double duration);
std::optional<ValidationError> validate_click(const ClickEvent& click, const std::string& path);
std::optional<ValidationError> validate_zoom(const ZoomEffect& zoom, const std::string& path);
// Default zoom: geometry rules only, its interval is never consulted.
std::optional<ValidationError> validate_default_zoom(const ZoomEffect& zoom);
std::optional<ValidationError> validate_overlay(const TextOverlay& overlay, const std::string& path);

std::optional<ValidationError> validate_zooms(const std::vector<ZoomEffect>& zooms);
std::optional<ValidationError> validate_overlays(const std::vector<TextOverlay>& overlays);

} // namespace timeline_model
