#pragma once
#include <sprig/html/tags.h>

// SVG elements. All are Foreign: tag names keep their camel case and empty
// elements self-close.
// https://developer.mozilla.org/en-US/docs/Web/SVG/Element
namespace sprig::svg {

SPRIG_DEFINE_ELEMENT(a, "a", Foreign)
SPRIG_DEFINE_ELEMENT(animate, "animate", Foreign)
SPRIG_DEFINE_ELEMENT(animate_motion, "animateMotion", Foreign)
SPRIG_DEFINE_ELEMENT(animate_transform, "animateTransform", Foreign)
SPRIG_DEFINE_ELEMENT(circle, "circle", Foreign)
SPRIG_DEFINE_ELEMENT(clip_path, "clipPath", Foreign)
SPRIG_DEFINE_ELEMENT(defs, "defs", Foreign)
SPRIG_DEFINE_ELEMENT(desc, "desc", Foreign)
SPRIG_DEFINE_ELEMENT(ellipse, "ellipse", Foreign)
SPRIG_DEFINE_ELEMENT(fe_blend, "feBlend", Foreign)
SPRIG_DEFINE_ELEMENT(fe_color_matrix, "feColorMatrix", Foreign)
SPRIG_DEFINE_ELEMENT(fe_component_transfer, "feComponentTransfer", Foreign)
SPRIG_DEFINE_ELEMENT(fe_composite, "feComposite", Foreign)
SPRIG_DEFINE_ELEMENT(fe_convolve_matrix, "feConvolveMatrix", Foreign)
SPRIG_DEFINE_ELEMENT(fe_diffuse_lighting, "feDiffuseLighting", Foreign)
SPRIG_DEFINE_ELEMENT(fe_displacement_map, "feDisplacementMap", Foreign)
SPRIG_DEFINE_ELEMENT(fe_distant_light, "feDistantLight", Foreign)
SPRIG_DEFINE_ELEMENT(fe_drop_shadow, "feDropShadow", Foreign)
SPRIG_DEFINE_ELEMENT(fe_flood, "feFlood", Foreign)
SPRIG_DEFINE_ELEMENT(fe_func_a, "feFuncA", Foreign)
SPRIG_DEFINE_ELEMENT(fe_func_b, "feFuncB", Foreign)
SPRIG_DEFINE_ELEMENT(fe_func_g, "feFuncG", Foreign)
SPRIG_DEFINE_ELEMENT(fe_func_r, "feFuncR", Foreign)
SPRIG_DEFINE_ELEMENT(fe_gaussian_blur, "feGaussianBlur", Foreign)
SPRIG_DEFINE_ELEMENT(fe_image, "feImage", Foreign)
SPRIG_DEFINE_ELEMENT(fe_merge, "feMerge", Foreign)
SPRIG_DEFINE_ELEMENT(fe_merge_node, "feMergeNode", Foreign)
SPRIG_DEFINE_ELEMENT(fe_morphology, "feMorphology", Foreign)
SPRIG_DEFINE_ELEMENT(fe_offset, "feOffset", Foreign)
SPRIG_DEFINE_ELEMENT(fe_point_light, "fePointLight", Foreign)
SPRIG_DEFINE_ELEMENT(fe_specular_lighting, "feSpecularLighting", Foreign)
SPRIG_DEFINE_ELEMENT(fe_spot_light, "feSpotLight", Foreign)
SPRIG_DEFINE_ELEMENT(fe_tile, "feTile", Foreign)
SPRIG_DEFINE_ELEMENT(fe_turbulence, "feTurbulence", Foreign)
SPRIG_DEFINE_ELEMENT(filter, "filter", Foreign)
SPRIG_DEFINE_ELEMENT(foreign_object, "foreignObject", Foreign)
SPRIG_DEFINE_ELEMENT(g, "g", Foreign)
SPRIG_DEFINE_ELEMENT(image, "image", Foreign)
SPRIG_DEFINE_ELEMENT(line, "line", Foreign)
SPRIG_DEFINE_ELEMENT(linear_gradient, "linearGradient", Foreign)
SPRIG_DEFINE_ELEMENT(marker, "marker", Foreign)
SPRIG_DEFINE_ELEMENT(mask, "mask", Foreign)
SPRIG_DEFINE_ELEMENT(metadata, "metadata", Foreign)
SPRIG_DEFINE_ELEMENT(mpath, "mpath", Foreign)
SPRIG_DEFINE_ELEMENT(path, "path", Foreign)
SPRIG_DEFINE_ELEMENT(pattern, "pattern", Foreign)
SPRIG_DEFINE_ELEMENT(polygon, "polygon", Foreign)
SPRIG_DEFINE_ELEMENT(polyline, "polyline", Foreign)
SPRIG_DEFINE_ELEMENT(radial_gradient, "radialGradient", Foreign)
SPRIG_DEFINE_ELEMENT(rect, "rect", Foreign)
SPRIG_DEFINE_ELEMENT(script, "script", Foreign)
SPRIG_DEFINE_ELEMENT(set, "set", Foreign)
SPRIG_DEFINE_ELEMENT(stop, "stop", Foreign)
SPRIG_DEFINE_ELEMENT(style, "style", Foreign)
SPRIG_DEFINE_ELEMENT(svg, "svg", Foreign)
SPRIG_DEFINE_ELEMENT(switch_, "switch", Foreign)
SPRIG_DEFINE_ELEMENT(symbol, "symbol", Foreign)
SPRIG_DEFINE_ELEMENT(text, "text", Foreign)
SPRIG_DEFINE_ELEMENT(text_path, "textPath", Foreign)
SPRIG_DEFINE_ELEMENT(title, "title", Foreign)
SPRIG_DEFINE_ELEMENT(tspan, "tspan", Foreign)
SPRIG_DEFINE_ELEMENT(use, "use", Foreign)
SPRIG_DEFINE_ELEMENT(view, "view", Foreign)

} // namespace sprig::svg
