namespace restorer
{
  template <typename E>
  subscription callback_manager::
  subscribe (std::function<void (const E&)> h)
  {
    return add (
      [h = std::move (h)] (const steam_event& e)
      {
        if (const E* p = std::get_if<E> (&e))
          h (*p);
      });
  }
}
