#ifndef GASDYNLIBRARY_MACHRANGE_HPP
#define GASDYNLIBRARY_MACHRANGE_HPP
#include <petsc.h>
#include <cstddef>
#include <iterator>
#include <vector>

namespace gasdyn::isentropic {

/**
 * Lazy, finite, inclusive sequence of Mach numbers from min to max in steps of increment.  Each value is computed as min + i*increment so the values do not drift, and the end point is included
 * when it falls within floating point tolerance of a step.
 */
class MachRange {
   private:
    const PetscReal min;
    const PetscReal max;
    const PetscReal increment;
    const std::size_t count;

   public:
    class Iterator {
       private:
        const MachRange* range;
        std::size_t index;

       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PetscReal;
        using difference_type = std::ptrdiff_t;
        using pointer = const PetscReal*;
        using reference = PetscReal;

        Iterator(const MachRange* range, std::size_t index) : range(range), index(index) {}

        PetscReal operator*() const { return (*range)[index]; }

        Iterator& operator++() {
            index++;
            return *this;
        }

        Iterator operator++(int) {
            Iterator copy = *this;
            index++;
            return copy;
        }

        bool operator==(const Iterator& other) const { return range == other.range && index == other.index; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }
    };

    /**
     * @param min first Mach number, must be >= 0
     * @param max last Mach number, must be >= min
     * @param increment step, must be > 0
     */
    MachRange(PetscReal min, PetscReal max, PetscReal increment);

    [[nodiscard]] PetscReal GetMin() const { return min; }
    [[nodiscard]] PetscReal GetMax() const { return max; }
    [[nodiscard]] PetscReal GetIncrement() const { return increment; }

    //! number of Mach numbers in the range
    [[nodiscard]] std::size_t Size() const { return count; }

    PetscReal operator[](std::size_t index) const { return min + (PetscReal)index * increment; }

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, count); }

    //! materialize the range
    [[nodiscard]] std::vector<PetscReal> ToVector() const;
};

}  // namespace gasdyn::isentropic
#endif  // GASDYNLIBRARY_MACHRANGE_HPP
