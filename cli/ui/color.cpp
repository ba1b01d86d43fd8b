#include "color.h"

namespace hsearch::cli {

Color kColor;

}  // namespace hsearch::cli
