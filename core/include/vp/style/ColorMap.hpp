#pragma once
#include <string>

namespace vp {

// Either one color map for every panel, or a pair where the first applies to
// velocity-like panels and the second to expression panels.
class ColorMapChoice {
public:
  enum class Kind : unsigned char { Single, Paired };

  ColorMapChoice() : ColorMapChoice(paired("RdYlGn", "gnuplot_r")) {}

  static ColorMapChoice single(std::string map) {
    ColorMapChoice c(Kind::Single);
    c.first_ = std::move(map);
    return c;
  }

  static ColorMapChoice paired(std::string first, std::string second) {
    ColorMapChoice c(Kind::Paired);
    c.first_ = std::move(first);
    c.second_ = std::move(second);
    return c;
  }

  Kind kind() const { return kind_; }
  bool isPaired() const { return kind_ == Kind::Paired; }
  const std::string& first() const { return first_; }
  const std::string& second() const { return second_; }

  const std::string& resolve(bool expression) const {
    if (kind_ == Kind::Paired && expression) return second_;
    return first_;
  }

private:
  explicit ColorMapChoice(Kind k) : kind_(k) {}

  Kind kind_;
  std::string first_;
  std::string second_;
};

} // namespace vp
