#ifndef KRA_IMAGE_KRA_IMAGE_HPP_
#define KRA_IMAGE_KRA_IMAGE_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/surface.hpp>
#include <kra_image/lzf.hpp>
#include <kra_image/tile_stream.hpp>
#include <kra_image/compose.hpp>
#include <kra_image/crop.hpp>
#include <kra_image/container.hpp>
#include <kra_image/xml.hpp>
#include <kra_image/layer.hpp>
#include <kra_image/document.hpp>
#include <kra_image/extract.hpp>
#include <kra_image/png.hpp>

namespace kra_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:       pixel_format, color_mode, layer_bounds, decode_result, decode_options
//   - surface.hpp:     surface interface, memory_surface
//   - lzf.hpp:         LZF decompression
//   - tile_stream.hpp: layer tile stream parsing
//   - compose.hpp:     tile decoding and reassembly
//   - crop.hpp:        trimming to non-transparent content
//   - container.hpp:   package entries (ZIP or in-memory)
//   - document.hpp:    document, layer forest, clone resolution
//   - extract.hpp:     layer pixel extraction
//   - png.hpp:         PNG decode/encode for previews and exports

} // namespace kra_image

#endif // KRA_IMAGE_KRA_IMAGE_HPP_
