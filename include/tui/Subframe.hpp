#ifndef TUI_SUBFRAME_HPP
#define TUI_SUBFRAME_HPP

#include <memory>

#include <ncpp/Plane.hh>

// Child plane of a screen, placed by the derived class and rebuilt when its size changes.
class Subframe {
public:
    // Placement relative to the parent plane; a non-positive size hides the frame.
    struct Region {
        int y;
        int x;
        int rows;
        int cols;
    };

    Subframe();
    virtual ~Subframe();

    // Lays the frame out for the parent's current size. Returns false when it does not fit.
    bool Resize(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols);

    void Draw();

    // Size after the last Resize; 0 when the terminal is too small for the frame.
    unsigned Rows() const { return cached_rows_; }
    unsigned Cols() const { return cached_cols_; }

protected:
    virtual Region Place(unsigned parent_rows, unsigned parent_cols) const = 0;

    // Called with plane_ erased and valid.
    virtual void DrawContents() = 0;

    std::unique_ptr<ncpp::Plane> plane_;
    unsigned cached_rows_;
    unsigned cached_cols_;
};

#endif // TUI_SUBFRAME_HPP
