#include "parcelcity/Parcel.hpp"

#include "parcelcity/City.hpp"

namespace parcelcity {

void Parcel::simulate(City& city)
{
  if (m_building) m_building->simulate(city);
}

void Parcel::refreshView(const City& city) const
{
  city.viewAdapter().refreshView(*this, city);
}

} // namespace parcelcity
