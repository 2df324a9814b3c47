#include "tui/Subframe.hpp"

Subframe::Subframe() : plane_(nullptr), cached_rows_(0), cached_cols_(0) {}

Subframe::~Subframe() = default;

bool Subframe::Resize(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols) {
    const Region region = Place(parent_rows, parent_cols);
    if (region.rows <= 0 || region.cols <= 0) {
        plane_.reset();
        cached_rows_ = 0;
        cached_cols_ = 0;
        return false;
    }

    const unsigned rows = static_cast<unsigned>(region.rows);
    const unsigned cols = static_cast<unsigned>(region.cols);
    if (plane_ != nullptr && rows == cached_rows_ && cols == cached_cols_) {
        plane_->move(region.y, region.x);
        return true;
    }

    plane_ = std::make_unique<ncpp::Plane>(&parent, rows, cols, region.y, region.x);
    cached_rows_ = rows;
    cached_cols_ = cols;
    return true;
}

void Subframe::Draw() {
    if (plane_ == nullptr) {
        return;
    }
    plane_->erase();
    DrawContents();
}
