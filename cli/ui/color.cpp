#include "color.h"

namespace navsql::cli {

Color kColor;

void disable_color() {
  kColor.reset = "";
  kColor.red = "";
  kColor.green = "";
  kColor.yellow = "";
  kColor.blue = "";
  kColor.cyan = "";
  kColor.dim = "";
  kColor.bold = "";
}

}  // namespace navsql::cli
