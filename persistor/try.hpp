#pragma once

// Adapted from SerenityOS's TRY:
// https://github.com/SerenityOS/serenity/commit/8a879e205b9f336319572d181e5acf6c2fc31dfb

// evaluates to the value of a tl::expected, or returns its error from the
// enclosing function
#define TRY(expression)                         \
  __extension__({                               \
    auto _tmp = (expression);                   \
    if (!_tmp) [[unlikely]]                     \
      return tl::make_unexpected(_tmp.error()); \
    std::move(_tmp).value();                    \
  })

// same as TRY, for tl::expected<void, E> and discarded values
#define REQ(expression)                                 \
  {                                                     \
    if (auto _tmp = (expression); !_tmp) [[unlikely]] { \
      return tl::make_unexpected(_tmp.error());         \
    }                                                   \
  }
