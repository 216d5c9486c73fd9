#pragma once
#include <sprig/html/tags.h>

// MathML elements, all Foreign.
// https://developer.mozilla.org/en-US/docs/Web/MathML/Element
namespace sprig::mathml {

SPRIG_DEFINE_ELEMENT(annotation, "annotation", Foreign)
// The hyphen falls outside the tag name grammar, so rendering this fails
// with InvalidTagName.
SPRIG_DEFINE_ELEMENT(annotation_xml, "annotation-xml", Foreign)
SPRIG_DEFINE_ELEMENT(math, "math", Foreign)
SPRIG_DEFINE_ELEMENT(merror, "merror", Foreign)
SPRIG_DEFINE_ELEMENT(mfrac, "mfrac", Foreign)
SPRIG_DEFINE_ELEMENT(mi, "mi", Foreign)
SPRIG_DEFINE_ELEMENT(mmultiscripts, "mmultiscripts", Foreign)
SPRIG_DEFINE_ELEMENT(mn, "mn", Foreign)
SPRIG_DEFINE_ELEMENT(mo, "mo", Foreign)
SPRIG_DEFINE_ELEMENT(mover, "mover", Foreign)
SPRIG_DEFINE_ELEMENT(mpadded, "mpadded", Foreign)
SPRIG_DEFINE_ELEMENT(mphantom, "mphantom", Foreign)
SPRIG_DEFINE_ELEMENT(mprescripts, "mprescripts", Foreign)
SPRIG_DEFINE_ELEMENT(mroot, "mroot", Foreign)
SPRIG_DEFINE_ELEMENT(mrow, "mrow", Foreign)
SPRIG_DEFINE_ELEMENT(ms, "ms", Foreign)
SPRIG_DEFINE_ELEMENT(mspace, "mspace", Foreign)
SPRIG_DEFINE_ELEMENT(msqrt, "msqrt", Foreign)
SPRIG_DEFINE_ELEMENT(mstyle, "mstyle", Foreign)
SPRIG_DEFINE_ELEMENT(msub, "msub", Foreign)
SPRIG_DEFINE_ELEMENT(msubsup, "msubsup", Foreign)
SPRIG_DEFINE_ELEMENT(msup, "msup", Foreign)
SPRIG_DEFINE_ELEMENT(mtable, "mtable", Foreign)
SPRIG_DEFINE_ELEMENT(mtd, "mtd", Foreign)
SPRIG_DEFINE_ELEMENT(mtext, "mtext", Foreign)
SPRIG_DEFINE_ELEMENT(mtr, "mtr", Foreign)
SPRIG_DEFINE_ELEMENT(munder, "munder", Foreign)
SPRIG_DEFINE_ELEMENT(munderover, "munderover", Foreign)
SPRIG_DEFINE_ELEMENT(semantics, "semantics", Foreign)

} // namespace sprig::mathml
