#ifndef __CAPTERM_SCREEN_BUFFER_HPP__
#define __CAPTERM_SCREEN_BUFFER_HPP__

#include "Headers.hpp"

namespace capterm {
struct CursorPosition {
  int row;
  int col;
};

/**
 * @brief Fixed-size character grid fed with raw terminal output.
 *
 * Only home (ESC[H), cursor position (ESC[row;colH) and clear screen (ESC[2J)
 * are interpreted.  Every other control sequence is swallowed so it never
 * shows up in the rendered text.  Parser state survives across write() calls,
 * so sequences split between two pty reads are handled.
 */
class ScreenBuffer {
 public:
  ScreenBuffer(int _rows, int _cols);

  /** @brief Feeds output bytes through the parser into the grid. */
  void write(const char* buf, size_t count);
  void write(const string& s) { write(s.data(), s.length()); }

  /**
   * @brief Renders the visible grid as plain text: trailing whitespace is
   * trimmed per line and trailing blank lines are dropped.
   */
  string render() const;

  int getRows() const { return rows; }
  int getCols() const { return cols; }
  CursorPosition getCursor() const;
  char cellAt(int row, int col) const;

 protected:
  enum class ParseState {
    GROUND,
    ESCAPE,
    // ESC ( and friends take exactly one more byte
    CHARSET,
    CSI,
    OSC,
    OSC_ESCAPE,
  };

  void putChar(char c);
  void lineFeed();
  void wrapAndScroll();
  void scrollUp();
  void dispatchCsi(const string& sequence);
  void moveCursor(int row, int col);
  void clearGrid();

  const int rows;
  const int cols;
  vector<string> grid;
  int cursorRow;
  int cursorCol;
  ParseState state;
  string pendingSequence;
  // Set once a CSI outgrows MAX_CSI_LENGTH
  bool sequenceOverflow;
  mutable std::mutex gridMutex;
};
}  // namespace capterm

#endif  // __CAPTERM_SCREEN_BUFFER_HPP__
