#include "ScreenBuffer.hpp"

namespace capterm {
namespace {
// Upper bound on collected CSI parameter bytes.  Longer sequences are still
// consumed but never dispatched.
const size_t MAX_CSI_LENGTH = 64;

int parseCsiNumber(const string& s) {
  if (s.empty() || s.length() > 6 ||
      !std::all_of(s.begin(), s.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return 0;
  }
  return std::stoi(s);
}
}  // namespace

ScreenBuffer::ScreenBuffer(int _rows, int _cols)
    : rows(_rows),
      cols(_cols),
      cursorRow(0),
      cursorCol(0),
      state(ParseState::GROUND),
      sequenceOverflow(false) {
  if (rows <= 0 || cols <= 0) {
    throw std::runtime_error("Invalid screen size: " + to_string(rows) + "x" +
                             to_string(cols));
  }
  grid.assign(rows, string(cols, ' '));
}

void ScreenBuffer::write(const char* buf, size_t count) {
  lock_guard<std::mutex> guard(gridMutex);
  size_t i = 0;
  while (i < count) {
    unsigned char c = static_cast<unsigned char>(buf[i]);
    switch (state) {
      case ParseState::GROUND:
        if (c == 0x1b) {
          state = ParseState::ESCAPE;
        } else if (c == '\n') {
          lineFeed();
        } else if (c == '\r') {
          cursorCol = 0;
        } else if (c == '\b') {
          cursorCol = max(0, cursorCol - 1);
        } else if (c == '\t' || (c >= 0x20 && c != 0x7f)) {
          putChar(static_cast<char>(c));
        }
        // Remaining C0 controls (BEL, SO, SI, ...) carry nothing printable
        break;
      case ParseState::ESCAPE:
        if (c == '[') {
          pendingSequence.clear();
          sequenceOverflow = false;
          state = ParseState::CSI;
        } else if (c == ']') {
          state = ParseState::OSC;
        } else if (c == '(' || c == ')' || c == '*' || c == '+' || c == '#') {
          state = ParseState::CHARSET;
        } else if (c != 0x1b) {
          state = ParseState::GROUND;
        }
        break;
      case ParseState::CHARSET:
        state = ParseState::GROUND;
        break;
      case ParseState::CSI:
        if (c >= 0x20 && c <= 0x3f) {
          if (pendingSequence.length() < MAX_CSI_LENGTH) {
            pendingSequence.push_back(static_cast<char>(c));
          } else {
            sequenceOverflow = true;
          }
        } else if (c >= 0x40 && c <= 0x7e) {
          if (sequenceOverflow) {
            VLOG(2) << "Dropping oversized control sequence";
          } else {
            pendingSequence.push_back(static_cast<char>(c));
            dispatchCsi(pendingSequence);
          }
          pendingSequence.clear();
          sequenceOverflow = false;
          state = ParseState::GROUND;
        } else if (c == 0x1b) {
          pendingSequence.clear();
          state = ParseState::ESCAPE;
        } else {
          // Not a valid CSI byte, drop the whole sequence
          pendingSequence.clear();
          state = ParseState::GROUND;
        }
        break;
      case ParseState::OSC:
        if (c == 0x07) {
          state = ParseState::GROUND;
        } else if (c == 0x1b) {
          state = ParseState::OSC_ESCAPE;
        }
        break;
      case ParseState::OSC_ESCAPE:
        if (c == '\\') {
          state = ParseState::GROUND;
        } else {
          // ESC inside an OSC string that is not a string terminator starts a
          // new escape sequence with this byte.
          state = ParseState::ESCAPE;
          continue;
        }
        break;
    }
    i++;
  }
}

string ScreenBuffer::render() const {
  lock_guard<std::mutex> guard(gridMutex);
  vector<string> lines;
  lines.reserve(rows);
  for (const auto& row : grid) {
    string line;
    bool inEscape = false;
    for (char c : row) {
      if (c == 0x1b) {
        inEscape = true;
      } else if (inEscape) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
          inEscape = false;
        }
      } else {
        line.push_back(c);
      }
    }
    lines.push_back(trimRight(line, " \t"));
  }

  while (!lines.empty() && isBlank(lines.back())) {
    lines.pop_back();
  }
  return join(lines, "\n");
}

CursorPosition ScreenBuffer::getCursor() const {
  lock_guard<std::mutex> guard(gridMutex);
  CursorPosition cursor;
  cursor.row = cursorRow;
  cursor.col = cursorCol;
  return cursor;
}

char ScreenBuffer::cellAt(int row, int col) const {
  lock_guard<std::mutex> guard(gridMutex);
  if (row < 0 || row >= rows || col < 0 || col >= cols) {
    throw std::out_of_range("Cell out of range: " + to_string(row) + "," +
                            to_string(col));
  }
  return grid[row][col];
}

void ScreenBuffer::putChar(char c) {
  grid[cursorRow][cursorCol] = c;
  cursorCol++;
  wrapAndScroll();
}

void ScreenBuffer::lineFeed() {
  cursorRow++;
  cursorCol = 0;
  wrapAndScroll();
}

void ScreenBuffer::wrapAndScroll() {
  if (cursorCol >= cols) {
    cursorRow++;
    cursorCol = 0;
  }
  if (cursorRow >= rows) {
    scrollUp();
  }
}

void ScreenBuffer::scrollUp() {
  grid.erase(grid.begin());
  grid.push_back(string(cols, ' '));
  cursorRow = rows - 1;
}

void ScreenBuffer::dispatchCsi(const string& sequence) {
  char finalByte = sequence.back();
  string params = sequence.substr(0, sequence.length() - 1);
  if (finalByte == 'H') {
    if (params.empty()) {
      moveCursor(0, 0);
      return;
    }
    auto tokens = split(params, ';');
    int row = tokens.size() > 0 ? parseCsiNumber(tokens[0]) : 0;
    int col = tokens.size() > 1 ? parseCsiNumber(tokens[1]) : 0;
    moveCursor(row - 1, col - 1);
  } else if (sequence == "2J") {
    clearGrid();
  }
}

void ScreenBuffer::moveCursor(int row, int col) {
  cursorRow = max(0, min(row, rows - 1));
  cursorCol = max(0, min(col, cols - 1));
}

void ScreenBuffer::clearGrid() {
  for (auto& row : grid) {
    row.assign(cols, ' ');
  }
}
}  // namespace capterm
